// File: src/core/pattern.hpp
//
// Pattern: the unit of memory stored by the engine
//
// A pattern carries an opaque content payload, a harmonic profile that
// determines its coordinate, code locations and evidence collected by the
// analyzers, advisory relationship hints, and access statistics.

#pragma once

#include "core/types.hpp"
#include "core/coordinate.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <iosfwd>

namespace dpcm {

/// Semantic profile used to place a pattern in coordinate space
struct HarmonicProfile {
    std::string category;       ///< Open category key, e.g. "auth", "fractal"
    double strength{0.5};       ///< [0, 1]
    double confidence{0.5};     ///< [0, 1]
    double complexity{1.0};     ///< >= 0
    uint32_t occurrences{1};    ///< >= 1

    bool IsValid() const;

    bool operator==(const HarmonicProfile& other) const;
    bool operator!=(const HarmonicProfile& other) const { return !(*this == other); }
};

/// Source span where a pattern was observed
struct CodeLocation {
    std::string file;
    uint32_t start_line{0};
    uint32_t end_line{0};
    uint32_t start_column{0};
    uint32_t end_column{0};
    std::string symbol_name;
    std::string function_name;
    std::string class_name;

    bool operator==(const CodeLocation& other) const;
    bool operator!=(const CodeLocation& other) const { return !(*this == other); }

    /// "file:start_line"
    std::string Key() const;
};

/// Measurement backing a detection
struct Evidence {
    std::string type;
    double measurement{0.0};
    std::string description;
    double confidence{0.0};

    bool operator==(const Evidence& other) const;
};

/// Content payload. The engine never interprets `data`.
struct PatternContent {
    std::string title;
    std::string description;
    std::string classification;
    std::vector<std::string> tags;
    std::vector<uint8_t> data;
};

/// Advisory links to other patterns (no referential integrity)
struct RelationshipHints {
    std::vector<PatternID> related;
    std::vector<PatternID> causes;
    std::vector<PatternID> required_by;
};

/// Access statistics
struct AccessStats {
    Timestamp created_at;
    Timestamp last_accessed;
    uint64_t access_count{0};
    double relevance_score{0.0};

    void RecordAccess(const Timestamp& now) {
        last_accessed = now;
        ++access_count;
    }
};

/// A stored pattern
///
/// `coordinate` is derived from `profile` by the CoordinateHasher when the
/// pattern is stored; a caller-supplied value is overwritten.
struct Pattern {
    PatternID id;
    Coordinate coordinate;
    PatternContent content;
    HarmonicProfile profile;
    std::vector<CodeLocation> locations;
    std::vector<Evidence> evidence;
    RelationshipHints relationships;
    AccessStats access;

    /// Basic validity: valid profile and a non-empty category
    bool IsValid() const;

    /// Rough in-memory/on-disk footprint in bytes
    size_t EstimateSize() const;

    // Serialization
    void Serialize(std::ostream& out) const;

    /// @throws std::runtime_error on truncated or corrupt input
    static Pattern Deserialize(std::istream& in);

    std::vector<uint8_t> ToBytes() const;

    /// @return Pattern, or nullopt if the bytes do not decode
    static std::optional<Pattern> FromBytes(const uint8_t* data, size_t size);

    std::string ToString() const;
};

} // namespace dpcm
