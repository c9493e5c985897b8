// File: src/core/pattern.cpp
#include "core/pattern.hpp"
#include <sstream>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <cmath>

namespace dpcm {

namespace {

// Upper bound on any length prefix, guards against corrupt blobs
constexpr uint32_t kMaxFieldLength = 64u * 1024u * 1024u;

constexpr uint32_t kPatternFormatVersion = 1;

template<typename T>
void WritePod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template<typename T>
T ReadPod(std::istream& in) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!in) {
        throw std::runtime_error("Truncated pattern record");
    }
    return value;
}

uint32_t ReadLength(std::istream& in) {
    uint32_t len = ReadPod<uint32_t>(in);
    if (len > kMaxFieldLength) {
        throw std::runtime_error("Corrupt length prefix in pattern record");
    }
    return len;
}

void WriteString(std::ostream& out, const std::string& s) {
    WritePod(out, static_cast<uint32_t>(s.size()));
    out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

std::string ReadString(std::istream& in) {
    uint32_t len = ReadLength(in);
    std::string s(len, '\0');
    in.read(&s[0], len);
    if (!in) {
        throw std::runtime_error("Truncated string in pattern record");
    }
    return s;
}

void WriteIds(std::ostream& out, const std::vector<PatternID>& ids) {
    WritePod(out, static_cast<uint32_t>(ids.size()));
    for (const auto& id : ids) {
        id.Serialize(out);
    }
}

std::vector<PatternID> ReadIds(std::istream& in) {
    uint32_t count = ReadLength(in);
    std::vector<PatternID> ids;
    ids.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        ids.push_back(PatternID(ReadPod<PatternID::ValueType>(in)));
    }
    return ids;
}

} // anonymous namespace

// ============================================================================
// Value types
// ============================================================================

bool HarmonicProfile::IsValid() const {
    if (std::isnan(strength) || std::isnan(confidence) || std::isnan(complexity)) {
        return false;
    }
    return strength >= 0.0 && strength <= 1.0 &&
           confidence >= 0.0 && confidence <= 1.0 &&
           complexity >= 0.0 &&
           occurrences >= 1;
}

bool HarmonicProfile::operator==(const HarmonicProfile& other) const {
    return category == other.category &&
           strength == other.strength &&
           confidence == other.confidence &&
           complexity == other.complexity &&
           occurrences == other.occurrences;
}

bool CodeLocation::operator==(const CodeLocation& other) const {
    return file == other.file &&
           start_line == other.start_line && end_line == other.end_line &&
           start_column == other.start_column && end_column == other.end_column &&
           symbol_name == other.symbol_name &&
           function_name == other.function_name &&
           class_name == other.class_name;
}

std::string CodeLocation::Key() const {
    return file + ":" + std::to_string(start_line);
}

bool Evidence::operator==(const Evidence& other) const {
    return type == other.type && measurement == other.measurement &&
           description == other.description && confidence == other.confidence;
}

// ============================================================================
// Pattern
// ============================================================================

bool Pattern::IsValid() const {
    return !profile.category.empty() && profile.IsValid();
}

size_t Pattern::EstimateSize() const {
    size_t size = sizeof(Pattern);
    size += content.title.size() + content.description.size() +
            content.classification.size() + content.data.size();
    for (const auto& tag : content.tags) {
        size += tag.size() + sizeof(std::string);
    }
    size += profile.category.size();
    for (const auto& loc : locations) {
        size += sizeof(CodeLocation) + loc.file.size() + loc.symbol_name.size() +
                loc.function_name.size() + loc.class_name.size();
    }
    for (const auto& ev : evidence) {
        size += sizeof(Evidence) + ev.type.size() + ev.description.size();
    }
    size += (relationships.related.size() + relationships.causes.size() +
             relationships.required_by.size()) * sizeof(PatternID);
    return size;
}

void Pattern::Serialize(std::ostream& out) const {
    WritePod(out, kPatternFormatVersion);
    id.Serialize(out);

    WritePod(out, coordinate.x);
    WritePod(out, coordinate.y);
    WritePod(out, coordinate.z);

    // Content
    WriteString(out, content.title);
    WriteString(out, content.description);
    WriteString(out, content.classification);
    WritePod(out, static_cast<uint32_t>(content.tags.size()));
    for (const auto& tag : content.tags) {
        WriteString(out, tag);
    }
    WritePod(out, static_cast<uint32_t>(content.data.size()));
    out.write(reinterpret_cast<const char*>(content.data.data()),
              static_cast<std::streamsize>(content.data.size()));

    // Profile
    WriteString(out, profile.category);
    WritePod(out, profile.strength);
    WritePod(out, profile.confidence);
    WritePod(out, profile.complexity);
    WritePod(out, profile.occurrences);

    // Locations
    WritePod(out, static_cast<uint32_t>(locations.size()));
    for (const auto& loc : locations) {
        WriteString(out, loc.file);
        WritePod(out, loc.start_line);
        WritePod(out, loc.end_line);
        WritePod(out, loc.start_column);
        WritePod(out, loc.end_column);
        WriteString(out, loc.symbol_name);
        WriteString(out, loc.function_name);
        WriteString(out, loc.class_name);
    }

    // Evidence
    WritePod(out, static_cast<uint32_t>(evidence.size()));
    for (const auto& ev : evidence) {
        WriteString(out, ev.type);
        WritePod(out, ev.measurement);
        WriteString(out, ev.description);
        WritePod(out, ev.confidence);
    }

    WriteIds(out, relationships.related);
    WriteIds(out, relationships.causes);
    WriteIds(out, relationships.required_by);

    // Access statistics
    access.created_at.Serialize(out);
    access.last_accessed.Serialize(out);
    WritePod(out, access.access_count);
    WritePod(out, access.relevance_score);
}

Pattern Pattern::Deserialize(std::istream& in) {
    uint32_t version = ReadPod<uint32_t>(in);
    if (version != kPatternFormatVersion) {
        throw std::runtime_error("Unsupported pattern format version " + std::to_string(version));
    }

    Pattern p;
    p.id = PatternID(ReadPod<PatternID::ValueType>(in));

    p.coordinate.x = ReadPod<double>(in);
    p.coordinate.y = ReadPod<double>(in);
    p.coordinate.z = ReadPod<double>(in);

    p.content.title = ReadString(in);
    p.content.description = ReadString(in);
    p.content.classification = ReadString(in);
    uint32_t tag_count = ReadLength(in);
    p.content.tags.reserve(tag_count);
    for (uint32_t i = 0; i < tag_count; ++i) {
        p.content.tags.push_back(ReadString(in));
    }
    uint32_t data_size = ReadLength(in);
    p.content.data.resize(data_size);
    in.read(reinterpret_cast<char*>(p.content.data.data()), data_size);
    if (!in) {
        throw std::runtime_error("Truncated content payload in pattern record");
    }

    p.profile.category = ReadString(in);
    p.profile.strength = ReadPod<double>(in);
    p.profile.confidence = ReadPod<double>(in);
    p.profile.complexity = ReadPod<double>(in);
    p.profile.occurrences = ReadPod<uint32_t>(in);

    uint32_t loc_count = ReadLength(in);
    p.locations.reserve(loc_count);
    for (uint32_t i = 0; i < loc_count; ++i) {
        CodeLocation loc;
        loc.file = ReadString(in);
        loc.start_line = ReadPod<uint32_t>(in);
        loc.end_line = ReadPod<uint32_t>(in);
        loc.start_column = ReadPod<uint32_t>(in);
        loc.end_column = ReadPod<uint32_t>(in);
        loc.symbol_name = ReadString(in);
        loc.function_name = ReadString(in);
        loc.class_name = ReadString(in);
        p.locations.push_back(std::move(loc));
    }

    uint32_t ev_count = ReadLength(in);
    p.evidence.reserve(ev_count);
    for (uint32_t i = 0; i < ev_count; ++i) {
        Evidence ev;
        ev.type = ReadString(in);
        ev.measurement = ReadPod<double>(in);
        ev.description = ReadString(in);
        ev.confidence = ReadPod<double>(in);
        p.evidence.push_back(std::move(ev));
    }

    p.relationships.related = ReadIds(in);
    p.relationships.causes = ReadIds(in);
    p.relationships.required_by = ReadIds(in);

    p.access.created_at = Timestamp::FromMicros(ReadPod<int64_t>(in));
    p.access.last_accessed = Timestamp::FromMicros(ReadPod<int64_t>(in));
    p.access.access_count = ReadPod<uint64_t>(in);
    p.access.relevance_score = ReadPod<double>(in);

    return p;
}

std::vector<uint8_t> Pattern::ToBytes() const {
    std::ostringstream oss(std::ios::binary);
    Serialize(oss);
    const std::string& s = oss.str();
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::optional<Pattern> Pattern::FromBytes(const uint8_t* data, size_t size) {
    std::istringstream iss(std::string(reinterpret_cast<const char*>(data), size),
                           std::ios::binary);
    try {
        return Deserialize(iss);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

std::string Pattern::ToString() const {
    std::ostringstream oss;
    oss << "Pattern{id=" << id.ToString()
        << ", category=" << profile.category
        << ", coord=" << coordinate.ToString()
        << ", strength=" << profile.strength
        << ", occurrences=" << profile.occurrences
        << ", accesses=" << access.access_count << "}";
    return oss.str();
}

} // namespace dpcm
