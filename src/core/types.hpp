// File: src/core/types.hpp
#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <atomic>
#include <chrono>
#include <optional>
#include <iosfwd>

namespace dpcm {

// PatternID: Unique identifier for stored patterns
// Uses 64-bit integer for efficiency and range
class PatternID {
public:
    using ValueType = uint64_t;

    // Default constructor creates invalid ID
    PatternID() : value_(kInvalidID) {}

    explicit PatternID(ValueType value) : value_(value) {}

    // Generate new unique ID (thread-safe)
    static PatternID Generate();

    // Make sure future Generate() calls never return a value <= floor.
    // Called after reloading persisted patterns.
    static void ReserveUpTo(ValueType floor);

    bool IsValid() const { return value_ != kInvalidID; }

    ValueType value() const { return value_; }

    bool operator==(const PatternID& other) const { return value_ == other.value_; }
    bool operator!=(const PatternID& other) const { return value_ != other.value_; }
    bool operator<(const PatternID& other) const { return value_ < other.value_; }
    bool operator>(const PatternID& other) const { return value_ > other.value_; }
    bool operator<=(const PatternID& other) const { return value_ <= other.value_; }
    bool operator>=(const PatternID& other) const { return value_ >= other.value_; }

    // String conversion for debugging
    std::string ToString() const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static PatternID Deserialize(std::istream& in);

    struct Hash {
        size_t operator()(const PatternID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kInvalidID = 0;
    static std::atomic<ValueType> next_id_;

    ValueType value_;
};

// Timestamp: Microsecond-precision wall-clock time point
// Wall clock (not steady) so persisted access times survive restarts.
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    static Timestamp Now();

    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates zero timestamp
    Timestamp() : time_point_(TimePoint{}) {}

    int64_t ToMicros() const;

    bool IsZero() const { return time_point_ == TimePoint{}; }

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    template<typename Rep, typename Period>
    Timestamp operator+(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(time_point_ + std::chrono::duration_cast<ClockType::duration>(d));
    }

    template<typename Rep, typename Period>
    Timestamp operator-(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(time_point_ - std::chrono::duration_cast<ClockType::duration>(d));
    }

    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    std::string ToString() const;

    void Serialize(std::ostream& out) const;
    static Timestamp Deserialize(std::istream& in);

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

/// Source of "now" for time-dependent components (migration, warming).
/// Tests inject a manual clock to simulate inactivity.
using Clock = std::function<Timestamp()>;

/// Clock backed by Timestamp::Now()
Clock SystemClock();

/// Hours elapsed from `since` to `now` (0 if `since` is later)
double HoursBetween(const Timestamp& since, const Timestamp& now);

// StorageTier: cost/performance class a pattern is placed in
// Ordered from best to worst; see TierRank().
enum class StorageTier : uint8_t {
    PREMIUM = 0,
    STANDARD = 1,
    ARCHIVE = 2,
    REJECTED = 3,
};

constexpr size_t kStorageTierCount = 4;

const char* ToString(StorageTier tier);

std::optional<StorageTier> ParseStorageTier(const std::string& str);

/// Rank used for ordering tiers: PREMIUM = 3 ... REJECTED = 0
int TierRank(StorageTier tier);

/// True if `a` is a strictly better tier than `b`
inline bool IsBetterTier(StorageTier a, StorageTier b) {
    return TierRank(a) > TierRank(b);
}

/// Tiers that serve queries (everything except REJECTED), best first
const std::array<StorageTier, 3>& QueryableTiers();

} // namespace dpcm

namespace std {
    template<>
    struct hash<dpcm::PatternID> {
        size_t operator()(const dpcm::PatternID& id) const {
            return dpcm::PatternID::Hash()(id);
        }
    };
}
