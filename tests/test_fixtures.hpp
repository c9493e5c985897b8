// File: tests/test_fixtures.hpp
//
// Shared test utilities
//
// Provides:
// - MakePattern / MakeProfile: patterns with known profiles
// - ManualClock: a Clock tests advance by hand
// - FailingTierStore: an ITierStore whose reads and writes can be switched
//   to throw TierUnavailableError
// - MemoryStores / TempDbPath: common setup helpers

#ifndef DPCM_TEST_FIXTURES_HPP
#define DPCM_TEST_FIXTURES_HPP

#include "core/errors.hpp"
#include "core/pattern.hpp"
#include "core/types.hpp"
#include "memory/quality_tier_router.hpp"
#include "storage/tier_store.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace dpcm {
namespace testing {

inline HarmonicProfile MakeProfile(const std::string& category,
                                   double strength = 0.5,
                                   double confidence = 0.5,
                                   double complexity = 1.0,
                                   uint32_t occurrences = 1) {
    HarmonicProfile profile;
    profile.category = category;
    profile.strength = strength;
    profile.confidence = confidence;
    profile.complexity = complexity;
    profile.occurrences = occurrences;
    return profile;
}

inline Pattern MakePattern(const std::string& title,
                           const HarmonicProfile& profile,
                           PatternID id = PatternID()) {
    Pattern p;
    p.id = id;
    p.profile = profile;
    p.content.title = title;
    p.content.description = "Detected " + title;
    p.content.classification = profile.category;
    return p;
}

/// Base score about .92: premium with or without the freshness bonus
inline Pattern MakePremiumPattern(const std::string& title, PatternID id = PatternID()) {
    return MakePattern(title, MakeProfile("performance", 0.95, 0.95, 9.0, 50), id);
}

/// Base score about .71, at most .81 fresh: standard band
inline Pattern MakeStandardPattern(const std::string& title, PatternID id = PatternID()) {
    return MakePattern(title, MakeProfile("performance", 0.85, 0.85, 5.0, 10), id);
}

/// Base score about .52, at most .62 fresh: archive band
inline Pattern MakeArchivePattern(const std::string& title, PatternID id = PatternID()) {
    return MakePattern(title, MakeProfile("performance", 0.65, 0.65, 3.0, 5), id);
}

/// Base score about .17: rejected
inline Pattern MakeRejectedPattern(const std::string& title, PatternID id = PatternID()) {
    return MakePattern(title, MakeProfile("performance", 0.2, 0.2, 1.0, 1), id);
}

/// Clock whose time only moves when the test says so
class ManualClock {
public:
    explicit ManualClock(int64_t start_micros = 1700000000LL * 1000000LL)
        : micros_(std::make_shared<std::atomic<int64_t>>(start_micros)) {}

    Clock AsClock() const {
        auto micros = micros_;
        return [micros] { return Timestamp::FromMicros(micros->load()); };
    }

    Timestamp Now() const { return Timestamp::FromMicros(micros_->load()); }

    template<typename Rep, typename Period>
    void Advance(std::chrono::duration<Rep, Period> d) {
        micros_->fetch_add(std::chrono::duration_cast<std::chrono::microseconds>(d).count());
    }

private:
    std::shared_ptr<std::atomic<int64_t>> micros_;
};

/// Switches shared between a test and the FailingTierStore it handed away
struct FailureSwitch {
    std::atomic<bool> fail_reads{false};
    std::atomic<bool> fail_writes{false};

    void FailAll(bool fail) {
        fail_reads.store(fail);
        fail_writes.store(fail);
    }
};

/// In-memory store that throws TierUnavailableError on demand
class FailingTierStore : public ITierStore {
public:
    FailingTierStore(StorageTier tier, std::shared_ptr<FailureSwitch> failures)
        : inner_(CreateMemoryTierStore(tier)), failures_(std::move(failures)) {}

    void Put(const Pattern& pattern) override {
        CheckWrite();
        inner_->Put(pattern);
    }

    void PutBatch(const std::vector<Pattern>& patterns) override {
        CheckWrite();
        inner_->PutBatch(patterns);
    }

    std::optional<Pattern> Get(PatternID id) override {
        CheckRead();
        return inner_->Get(id);
    }

    bool Delete(PatternID id) override {
        CheckWrite();
        return inner_->Delete(id);
    }

    std::vector<Pattern> Scan(const ScanFilter& filter) override {
        CheckRead();
        return inner_->Scan(filter);
    }

    size_t Count() override {
        CheckRead();
        return inner_->Count();
    }

    StorageTier GetTier() const override { return inner_->GetTier(); }
    std::string GetName() const override { return "failing-" + inner_->GetName(); }

private:
    void CheckRead() const {
        if (failures_->fail_reads.load()) {
            throw TierUnavailableError(inner_->GetTier(), "injected read failure");
        }
    }

    void CheckWrite() const {
        if (failures_->fail_writes.load()) {
            throw TierUnavailableError(inner_->GetTier(), "injected write failure");
        }
    }

    std::unique_ptr<ITierStore> inner_;
    std::shared_ptr<FailureSwitch> failures_;
};

/// One in-memory store per tier
inline QualityTierRouter::TierStores MemoryStores() {
    QualityTierRouter::TierStores stores;
    for (size_t i = 0; i < kStorageTierCount; ++i) {
        stores[i] = CreateMemoryTierStore(static_cast<StorageTier>(i));
    }
    return stores;
}

/// In-memory stores where `tier` is a FailingTierStore driven by `failures`
inline QualityTierRouter::TierStores StoresWithFailingTier(StorageTier tier,
                                                           std::shared_ptr<FailureSwitch> failures) {
    QualityTierRouter::TierStores stores = MemoryStores();
    stores[static_cast<size_t>(tier)] = std::make_unique<FailingTierStore>(tier, std::move(failures));
    return stores;
}

/// Unique temporary database path
inline std::string TempDbPath(const std::string& name) {
    static std::atomic<int> counter{0};
    return "/tmp/test_" + name + "_" +
           std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + "_" +
           std::to_string(counter++) + ".db";
}

} // namespace testing
} // namespace dpcm

#endif // DPCM_TEST_FIXTURES_HPP
