// File: src/engine/engine_config.cpp
//
// YAML Configuration Implementation for the DPCM memory engine

#include "engine/engine_config.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace dpcm {

namespace {

// Helper function to read string from YAML scalar
std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

uint64_t ParseUnsigned(const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("expected a non-negative integer");
    }
    return std::stoull(value);
}

template <typename T>
struct IsDuration : std::false_type {};

template <typename Rep, typename Period>
struct IsDuration<std::chrono::duration<Rep, Period>> : std::true_type {};

const char* SplitStrategyName(SpatialIndex::SplitStrategy strategy) {
    return strategy == SpatialIndex::SplitStrategy::LINEAR ? "linear" : "quadratic";
}

template <typename T>
void Assign(T& target, const std::string& value) {
    if constexpr (std::is_same_v<T, bool>) {
        target = ParseBool(value);
    } else if constexpr (std::is_same_v<T, std::string>) {
        target = value;
    } else if constexpr (std::is_floating_point_v<T>) {
        target = static_cast<T>(std::stod(value));
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        target = static_cast<T>(std::stoll(value));
    } else if constexpr (std::is_integral_v<T>) {
        target = static_cast<T>(ParseUnsigned(value));
    } else if constexpr (IsDuration<T>::value) {
        target = T(static_cast<typename T::rep>(std::stoll(value)));
    } else if constexpr (std::is_same_v<T, SpatialIndex::SplitStrategy>) {
        if (value == "linear") target = SpatialIndex::SplitStrategy::LINEAR;
        else if (value == "quadratic") target = SpatialIndex::SplitStrategy::QUADRATIC;
        else throw std::invalid_argument("expected linear or quadratic");
    }
}

template <typename T>
std::string Format(const T& value) {
    std::ostringstream ss;
    if constexpr (std::is_same_v<T, bool>) {
        ss << (value ? "true" : "false");
    } else if constexpr (std::is_same_v<T, std::string>) {
        ss << "\"" << value << "\"";
    } else if constexpr (IsDuration<T>::value) {
        ss << value.count();
    } else if constexpr (std::is_same_v<T, SpatialIndex::SplitStrategy>) {
        ss << SplitStrategyName(value);
    } else {
        ss << value;
    }
    return ss.str();
}

/// Visit every scalar setting as (section, key, member)
///
/// Shared by the loader and the writer so the two never drift apart.
template <typename Config, typename Fn>
void ForEachSetting(Config& c, Fn&& fn) {
    // engine
    fn("engine", "dedup_on_store", c.engine.dedup_on_store);
    fn("engine", "hot_cache_capacity", c.engine.hot_cache_capacity);
    fn("engine", "tier_fetch_timeout_ms", c.engine.tier_fetch_timeout);
    fn("engine", "recent_query_window", c.engine.recent_query_window);
    fn("engine", "use_worker_pool", c.engine.use_worker_pool);
    fn("engine", "check_consistency_on_migrate", c.engine.check_consistency_on_migrate);

    // hasher
    fn("hasher", "category_spread", c.hasher.category_spread);
    fn("hasher", "quality_offset_scale", c.hasher.quality_offset_scale);
    fn("hasher", "strength_weight_x", c.hasher.strength_weight_x);
    fn("hasher", "complexity_weight_y", c.hasher.complexity_weight_y);
    fn("hasher", "occurrence_weight_z", c.hasher.occurrence_weight_z);
    fn("hasher", "jitter_scale", c.hasher.jitter_scale);
    fn("hasher", "complexity_normalizer", c.hasher.complexity_normalizer);
    fn("hasher", "composition_precision", c.hasher.composition_precision);

    // index
    fn("index", "max_entries", c.index.max_entries);
    fn("index", "min_entries", c.index.min_entries);
    fn("index", "split_strategy", c.index.split_strategy);
    fn("index", "linear_scan", c.index.linear_scan);

    // field
    fn("field", "default_radius", c.field.default_radius);
    fn("field", "default_amplitude", c.field.default_amplitude);
    fn("field", "default_steepness", c.field.default_steepness);
    fn("field", "precision_base_radius", c.field.precision_base_radius);
    fn("field", "precision_confidence_span", c.field.precision_confidence_span);
    fn("field", "precision_amplitude", c.field.precision_amplitude);
    fn("field", "precision_steepness", c.field.precision_steepness);
    fn("field", "discovery_base_radius", c.field.discovery_base_radius);
    fn("field", "discovery_exploration_span", c.field.discovery_exploration_span);
    fn("field", "discovery_amplitude", c.field.discovery_amplitude);
    fn("field", "discovery_steepness", c.field.discovery_steepness);
    fn("field", "creative_base_radius", c.field.creative_base_radius);
    fn("field", "creative_radius_span", c.field.creative_radius_span);
    fn("field", "creative_base_amplitude", c.field.creative_base_amplitude);
    fn("field", "creative_amplitude_span", c.field.creative_amplitude_span);
    fn("field", "creative_base_steepness", c.field.creative_base_steepness);
    fn("field", "creative_steepness_span", c.field.creative_steepness_span);
    fn("field", "low_confidence_threshold", c.field.low_confidence_threshold);
    fn("field", "low_confidence_radius_factor", c.field.low_confidence_radius_factor);
    fn("field", "low_confidence_amplitude_factor", c.field.low_confidence_amplitude_factor);
    fn("field", "high_confidence_threshold", c.field.high_confidence_threshold);
    fn("field", "high_confidence_radius_factor", c.field.high_confidence_radius_factor);
    fn("field", "high_confidence_amplitude_factor", c.field.high_confidence_amplitude_factor);
    fn("field", "urgency_threshold_ms", c.field.urgency_threshold_ms);
    fn("field", "urgency_radius_factor", c.field.urgency_radius_factor);
    fn("field", "urgency_steepness_factor", c.field.urgency_steepness_factor);
    fn("field", "low_hit_rate", c.field.low_hit_rate);
    fn("field", "low_hit_rate_radius_factor", c.field.low_hit_rate_radius_factor);
    fn("field", "high_hit_rate", c.field.high_hit_rate);
    fn("field", "high_hit_rate_radius_factor", c.field.high_hit_rate_radius_factor);
    fn("field", "base_morphing_rate", c.field.base_morphing_rate);
    fn("field", "creative_morphing_factor", c.field.creative_morphing_factor);
    fn("field", "emergence_threshold", c.field.emergence_threshold);
    fn("field", "emergence_morphing_factor", c.field.emergence_morphing_factor);
    fn("field", "diverse_query_types", c.field.diverse_query_types);
    fn("field", "diverse_morphing_factor", c.field.diverse_morphing_factor);
    fn("field", "base_context_sensitivity", c.field.base_context_sensitivity);
    fn("field", "fast_response_ms", c.field.fast_response_ms);
    fn("field", "fast_response_factor", c.field.fast_response_factor);
    fn("field", "focused_min_queries", c.field.focused_min_queries);
    fn("field", "focused_context_factor", c.field.focused_context_factor);
    fn("field", "ellipse_elongation", c.field.ellipse_elongation);
    fn("field", "fractal_octaves", c.field.fractal_octaves);
    fn("field", "fractal_weight", c.field.fractal_weight);
    fn("field", "adaptive_weight", c.field.adaptive_weight);
    fn("field", "morph_radius_step", c.field.morph_radius_step);
    fn("field", "morph_center_step", c.field.morph_center_step);
    fn("field", "morph_steepness_step", c.field.morph_steepness_step);
    fn("field", "min_radius", c.field.min_radius);
    fn("field", "max_radius", c.field.max_radius);
    fn("field", "min_steepness", c.field.min_steepness);
    fn("field", "max_steepness", c.field.max_steepness);
    fn("field", "breathing_amplitude", c.field.breathing_amplitude);
    fn("field", "pulse_amplitude", c.field.pulse_amplitude);
    fn("field", "random_seed", c.field.random_seed);

    // quality (category_weights is nested and handled separately)
    fn("quality", "strength_weight", c.quality.default_weights.strength);
    fn("quality", "confidence_weight", c.quality.default_weights.confidence);
    fn("quality", "complexity_weight", c.quality.default_weights.complexity);
    fn("quality", "occurrences_weight", c.quality.default_weights.occurrences);
    fn("quality", "complexity_normalizer", c.quality.complexity_normalizer);
    fn("quality", "occurrence_log_span", c.quality.occurrence_log_span);
    fn("quality", "recency_floor", c.quality.recency_floor);
    fn("quality", "recency_grace_hours", c.quality.recency_grace_hours);
    fn("quality", "recency_half_life_hours", c.quality.recency_half_life_hours);
    fn("quality", "freshness_weight", c.quality.freshness_weight);
    fn("quality", "freshness_decay_hours", c.quality.freshness_decay_hours);
    fn("quality", "premium_threshold", c.quality.premium_threshold);
    fn("quality", "standard_threshold", c.quality.standard_threshold);
    fn("quality", "archive_threshold", c.quality.archive_threshold);

    // router
    fn("router", "max_retry_attempts", c.router.max_retry_attempts);
    fn("router", "retry_base_backoff_ms", c.router.retry_base_backoff_ms);
    fn("router", "retry_max_backoff_ms", c.router.retry_max_backoff_ms);
    fn("router", "max_pending_writes", c.router.max_pending_writes);

    // migration
    fn("migration", "batch_size", c.migration.batch_size);
    fn("migration", "batch_yield_ms", c.migration.batch_yield);
    fn("migration", "rescore_interval_hours", c.migration.rescore_interval_hours);
    fn("migration", "min_residency_hours", c.migration.min_residency_hours);
    fn("migration", "history_limit", c.migration.history_limit);
    fn("migration", "cycle_interval_ms", c.migration.cycle_interval);

    // dedup
    fn("dedup", "candidate_radius", c.dedup.candidate_radius);
    fn("dedup", "min_similarity", c.dedup.min_similarity);
    fn("dedup", "auto_merge_threshold", c.dedup.auto_merge_threshold);
    fn("dedup", "auto_merge", c.dedup.auto_merge);
    fn("dedup", "structural_weight", c.dedup.structural_weight);
    fn("dedup", "semantic_weight", c.dedup.semantic_weight);
    fn("dedup", "location_weight", c.dedup.location_weight);
    fn("dedup", "property_weight", c.dedup.property_weight);
    fn("dedup", "max_compare_length", c.dedup.max_compare_length);
    fn("dedup", "history_limit", c.dedup.history_limit);

    // warmer
    fn("warmer", "time_based_limit", c.warmer.time_based_limit);
    fn("warmer", "frequency_limit", c.warmer.frequency_limit);
    fn("warmer", "predictive_limit", c.warmer.predictive_limit);
    fn("warmer", "predictive_min_confidence", c.warmer.predictive_min_confidence);
    fn("warmer", "high_priority_share", c.warmer.high_priority_share);
    fn("warmer", "critical_access_count", c.warmer.critical_access_count);
    fn("warmer", "high_access_count", c.warmer.high_access_count);
    fn("warmer", "max_per_cycle", c.warmer.max_per_cycle);
    fn("warmer", "batch_size", c.warmer.batch_size);
    fn("warmer", "batch_yield_ms", c.warmer.batch_yield);
    fn("warmer", "cycle_interval_ms", c.warmer.cycle_interval);
    fn("warmer", "max_recent_accesses", c.warmer.max_recent_accesses);

    // materializer
    fn("materializer", "ttl_s", c.materializer.ttl);
    fn("materializer", "max_views", c.materializer.max_views);
    fn("materializer", "auto_materialize_min_accesses", c.materializer.auto_materialize_min_accesses);
    fn("materializer", "auto_materialize_min_compute_ms", c.materializer.auto_materialize_min_compute);
    fn("materializer", "max_profiles", c.materializer.max_profiles);

    // workers
    fn("workers", "max_workers", c.workers.max_workers);
    fn("workers", "min_workers", c.workers.min_workers);
    fn("workers", "memory_pressure_mb", c.workers.memory_pressure_mb);
    fn("workers", "memory_critical_mb", c.workers.memory_critical_mb);
    fn("workers", "low_pressure_ratio", c.workers.low_pressure_ratio);
    fn("workers", "task_timeout_ms", c.workers.task_timeout);
    fn("workers", "scale_interval_ms", c.workers.scale_interval);
    fn("workers", "watchdog_interval_ms", c.workers.watchdog_interval);
    fn("workers", "shutdown_grace_ms", c.workers.shutdown_grace);
    fn("workers", "max_batch_size", c.workers.max_batch_size);
    fn("workers", "auto_scale", c.workers.auto_scale);

    // storage
    fn("storage", "backend", c.storage.backend);
    fn("storage", "premium_backend", c.storage.tier_backends[static_cast<size_t>(StorageTier::PREMIUM)]);
    fn("storage", "standard_backend", c.storage.tier_backends[static_cast<size_t>(StorageTier::STANDARD)]);
    fn("storage", "archive_backend", c.storage.tier_backends[static_cast<size_t>(StorageTier::ARCHIVE)]);
    fn("storage", "rejected_backend", c.storage.tier_backends[static_cast<size_t>(StorageTier::REJECTED)]);
    fn("storage", "directory", c.storage.directory);
    fn("storage", "file_prefix", c.storage.file_prefix);
    fn("storage", "sqlite_enable_wal", c.storage.sqlite.enable_wal);
    fn("storage", "sqlite_cache_size_kb", c.storage.sqlite.cache_size_kb);
    fn("storage", "sqlite_busy_timeout_ms", c.storage.sqlite.busy_timeout_ms);
    fn("storage", "sqlite_synchronous", c.storage.sqlite.synchronous);

    // logging
    fn("logging", "level", c.logging.level);
    fn("logging", "console", c.logging.console);
    fn("logging", "file_path", c.logging.file_path);
    fn("logging", "truncate_file", c.logging.truncate_file);
    fn("logging", "pattern", c.logging.pattern);
}

void ApplyCategoryWeight(EngineConfig& config, const std::string& category,
                         const std::string& key, const std::string& value) {
    const std::string normalized = CoordinateHasher::NormalizeCategory(category);
    auto it = config.quality.category_weights.find(normalized);
    if (it == config.quality.category_weights.end()) {
        it = config.quality.category_weights.emplace(normalized, config.quality.default_weights).first;
    }
    QualityWeights& weights = it->second;
    if (key == "strength") Assign(weights.strength, value);
    else if (key == "confidence") Assign(weights.confidence, value);
    else if (key == "complexity") Assign(weights.complexity, value);
    else if (key == "occurrences") Assign(weights.occurrences, value);
}

/// Apply one scalar at `path` (section, key[, ...]); unknown paths are ignored
void ApplySetting(EngineConfig& config, const std::vector<std::string>& path,
                  const std::string& value) {
    if (path.size() == 4 && path[0] == "quality" && path[1] == "category_weights") {
        ApplyCategoryWeight(config, path[2], path[3], value);
        return;
    }
    if (path.size() != 2) {
        return;
    }
    ForEachSetting(config, [&](const char* section, const char* key, auto& member) {
        if (path[0] == section && path[1] == key) {
            Assign(member, value);
        }
    });
}

/// Parser position inside one YAML mapping
struct MappingFrame {
    std::string key;            ///< Key this mapping is the value of
    std::string pending_key;    ///< Key awaiting its value
    bool expecting_key = true;
};

std::string JoinPath(const std::vector<std::string>& path) {
    std::string joined;
    for (const auto& part : path) {
        if (!joined.empty()) joined += '.';
        joined += part;
    }
    return joined;
}

} // anonymous namespace

// ============================================================================
// StorageConfig
// ============================================================================

std::string StorageConfig::BackendFor(StorageTier tier) const {
    const std::string& override_backend = tier_backends[static_cast<size_t>(tier)];
    return override_backend.empty() ? backend : override_backend;
}

std::string StorageConfig::PathFor(StorageTier tier) const {
    std::string path = directory;
    if (!path.empty() && path.back() != '/') {
        path += '/';
    }
    return path + file_prefix + "_" + ToString(tier) + ".db";
}

// ============================================================================
// Loading
// ============================================================================

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath,
                                                       std::vector<std::string>* errors) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        if (errors) errors->push_back("Failed to open config file: " + filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str(), errors);
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content,
                                                         std::vector<std::string>* errors) {
    std::vector<std::string> problems;

    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        if (errors) errors->push_back("Failed to initialize YAML parser");
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::vector<MappingFrame> stack;
    int sequence_depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::ostringstream msg;
            msg << "YAML parse error at line " << (parser.problem_mark.line + 1) << ": "
                << (parser.problem ? parser.problem : "unknown problem");
            if (errors) errors->push_back(msg.str());
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT: {
                MappingFrame frame;
                if (sequence_depth == 0 && !stack.empty()) {
                    frame.key = stack.back().pending_key;
                }
                stack.push_back(frame);
                break;
            }

            case YAML_MAPPING_END_EVENT:
                if (!stack.empty()) {
                    stack.pop_back();
                }
                if (sequence_depth == 0 && !stack.empty()) {
                    stack.back().expecting_key = true;
                }
                break;

            case YAML_SEQUENCE_START_EVENT:
                // Lists carry no settings; skip their contents
                ++sequence_depth;
                break;

            case YAML_SEQUENCE_END_EVENT:
                --sequence_depth;
                if (sequence_depth == 0 && !stack.empty()) {
                    stack.back().expecting_key = true;
                }
                break;

            case YAML_SCALAR_EVENT: {
                if (sequence_depth > 0 || stack.empty()) {
                    break;
                }
                std::string value = GetScalarValue(&event);
                MappingFrame& top = stack.back();

                if (top.expecting_key) {
                    // This is a key
                    top.pending_key = value;
                    top.expecting_key = false;
                } else {
                    // This is a value
                    std::vector<std::string> path;
                    for (size_t i = 1; i < stack.size(); ++i) {
                        path.push_back(stack[i].key);
                    }
                    path.push_back(top.pending_key);

                    try {
                        ApplySetting(config, path, value);
                    } catch (const std::invalid_argument&) {
                        problems.push_back(JoinPath(path) + ": invalid value '" + value + "'");
                    } catch (const std::out_of_range&) {
                        problems.push_back(JoinPath(path) + ": value out of range '" + value + "'");
                    }
                    top.expecting_key = true;
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    for (auto& error : config.GetValidationErrors()) {
        problems.push_back(std::move(error));
    }
    if (!problems.empty()) {
        if (errors) {
            errors->insert(errors->end(), problems.begin(), problems.end());
        }
        return std::nullopt;
    }

    return config;
}

// ============================================================================
// Saving
// ============================================================================

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# DPCM Memory Engine Configuration\n";
    ss << "# Auto-generated configuration file\n";

    std::string current_section;
    ForEachSetting(*this, [&](const char* section, const char* key, const auto& member) {
        if (current_section != section) {
            current_section = section;
            ss << "\n" << section << ":\n";
        }
        ss << "  " << key << ": " << Format(member) << "\n";

        // Nested weight table goes after the last quality scalar
        if (current_section == "quality" && std::string(key) == "archive_threshold") {
            ss << "  category_weights:\n";
            for (const auto& [category, weights] : quality.category_weights) {
                ss << "    " << category << ":\n";
                ss << "      strength: " << weights.strength << "\n";
                ss << "      confidence: " << weights.confidence << "\n";
                ss << "      complexity: " << weights.complexity << "\n";
                ss << "      occurrences: " << weights.occurrences << "\n";
            }
        }
    });

    return ss.str();
}

// ============================================================================
// Validation
// ============================================================================

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Facade
    if (engine.hot_cache_capacity == 0) {
        errors.push_back("engine.hot_cache_capacity must be greater than 0");
    }
    if (engine.tier_fetch_timeout.count() <= 0) {
        errors.push_back("engine.tier_fetch_timeout_ms must be greater than 0");
    }

    // Components
    if (!hasher.IsValid()) errors.push_back("hasher settings are invalid");
    if (!index.IsValid()) errors.push_back("index settings are invalid (need max_entries >= 4 and 2 <= min_entries <= max_entries / 2)");
    if (!field.IsValid()) errors.push_back("field settings are invalid");
    if (!quality.IsValid()) {
        errors.push_back("quality settings are invalid (thresholds must satisfy "
                         "0 < archive < standard < premium <= 1)");
    }
    if (!router.IsValid()) errors.push_back("router settings are invalid");
    if (!migration.IsValid()) errors.push_back("migration settings are invalid");
    if (!dedup.IsValid()) errors.push_back("dedup settings are invalid");
    if (!warmer.IsValid()) errors.push_back("warmer settings are invalid");
    if (!materializer.IsValid()) errors.push_back("materializer settings are invalid");
    if (engine.use_worker_pool && !workers.IsValid()) {
        errors.push_back("workers settings are invalid");
    }

    // Storage
    for (size_t i = 0; i < kStorageTierCount; ++i) {
        auto tier = static_cast<StorageTier>(i);
        const std::string backend_name = storage.BackendFor(tier);
        if (backend_name != "memory" && backend_name != "sqlite") {
            errors.push_back(std::string("storage backend for ") + ToString(tier) +
                             " must be one of: memory, sqlite");
        } else if (backend_name == "sqlite" && storage.directory.empty()) {
            errors.push_back("storage.directory is required for sqlite tiers");
        }
    }
    if (storage.file_prefix.empty()) {
        errors.push_back("storage.file_prefix must not be empty");
    }
    if (storage.sqlite.synchronous != "FULL" && storage.sqlite.synchronous != "NORMAL" &&
        storage.sqlite.synchronous != "OFF") {
        errors.push_back("storage.sqlite_synchronous must be one of: FULL, NORMAL, OFF");
    }

    // Logging
    if (!logging::ParseLevel(logging.level)) {
        errors.push_back("logging.level must be one of: trace, debug, info, warn, error, critical, off");
    }
    if (logging.pattern.empty()) {
        errors.push_back("logging.pattern must not be empty");
    }

    return errors;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

} // namespace dpcm
