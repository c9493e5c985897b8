// File: src/core/types.cpp
#include "core/types.hpp"
#include <array>
#include <sstream>
#include <iomanip>
#include <istream>
#include <ostream>
#include <algorithm>
#include <cctype>

namespace dpcm {

std::atomic<PatternID::ValueType> PatternID::next_id_{1};

PatternID PatternID::Generate() {
    ValueType new_id = next_id_.fetch_add(1, std::memory_order_relaxed);
    return PatternID(new_id);
}

void PatternID::ReserveUpTo(ValueType floor) {
    ValueType current = next_id_.load(std::memory_order_relaxed);
    while (current <= floor &&
           !next_id_.compare_exchange_weak(current, floor + 1, std::memory_order_relaxed)) {
    }
}

std::string PatternID::ToString() const {
    if (!IsValid()) {
        return "PatternID(INVALID)";
    }
    std::ostringstream oss;
    oss << "PatternID(" << value_ << ")";
    return oss.str();
}

void PatternID::Serialize(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(&value_), sizeof(value_));
}

PatternID PatternID::Deserialize(std::istream& in) {
    ValueType value = kInvalidID;
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return PatternID(value);
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::string Timestamp::ToString() const {
    auto micros = ToMicros();
    auto seconds = micros / 1000000;
    auto remaining_micros = micros % 1000000;

    std::ostringstream oss;
    oss << "Timestamp(" << seconds << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "s)";
    return oss.str();
}

void Timestamp::Serialize(std::ostream& out) const {
    int64_t micros = ToMicros();
    out.write(reinterpret_cast<const char*>(&micros), sizeof(micros));
}

Timestamp Timestamp::Deserialize(std::istream& in) {
    int64_t micros = 0;
    in.read(reinterpret_cast<char*>(&micros), sizeof(micros));
    return FromMicros(micros);
}

Clock SystemClock() {
    return [] { return Timestamp::Now(); };
}

double HoursBetween(const Timestamp& since, const Timestamp& now) {
    if (now <= since) {
        return 0.0;
    }
    return static_cast<double>((now - since).count()) / 3.6e9;
}

// StorageTier implementations

const char* ToString(StorageTier tier) {
    switch (tier) {
        case StorageTier::PREMIUM: return "premium";
        case StorageTier::STANDARD: return "standard";
        case StorageTier::ARCHIVE: return "archive";
        case StorageTier::REJECTED: return "rejected";
        default: return "unknown";
    }
}

std::optional<StorageTier> ParseStorageTier(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "premium") return StorageTier::PREMIUM;
    if (lower == "standard") return StorageTier::STANDARD;
    if (lower == "archive") return StorageTier::ARCHIVE;
    if (lower == "rejected") return StorageTier::REJECTED;
    return std::nullopt;
}

int TierRank(StorageTier tier) {
    return static_cast<int>(kStorageTierCount) - 1 - static_cast<int>(tier);
}

const std::array<StorageTier, 3>& QueryableTiers() {
    static const std::array<StorageTier, 3> tiers = {
        StorageTier::PREMIUM, StorageTier::STANDARD, StorageTier::ARCHIVE};
    return tiers;
}

} // namespace dpcm
