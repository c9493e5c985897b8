// File: src/query/probability_field.hpp
//
// Probability-field query model
//
// A query intent is turned into a scoring region: a center (from the
// intent's harmonic signature), a radius, a shape and a falloff. Candidates
// returned by the spatial index are then scored by distance from the center.
// Points outside the radius always score exactly 0.
//
// Field geometry by query type:
//   precision : small radius shrinking with confidence, exponential falloff
//   discovery : wide radius growing with exploration, elliptical, polynomial
//   creative  : randomized radius/amplitude, fractal, gaussian
//
// Every constant is a Config default.

#pragma once

#include "core/coordinate.hpp"
#include "core/pattern.hpp"
#include "core/types.hpp"
#include "spatial/coordinate_hasher.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace dpcm {

enum class QueryType : uint8_t {
    PRECISION = 0,
    DISCOVERY = 1,
    CREATIVE = 2,
};

enum class FieldShape : uint8_t {
    SPHERICAL = 0,
    ELLIPTICAL = 1,
    ADAPTIVE = 2,
    FRACTAL = 3,
};

enum class FalloffFunction : uint8_t {
    EXPONENTIAL = 0,
    POLYNOMIAL = 1,
    GAUSSIAN = 2,
    SIGMOID = 3,
};

const char* ToString(QueryType type);
const char* ToString(FieldShape shape);
const char* ToString(FalloffFunction falloff);

std::optional<QueryType> ParseQueryType(const std::string& str);

/// What the caller is looking for
struct QueryIntent {
    QueryType type{QueryType::DISCOVERY};
    std::optional<HarmonicProfile> harmonic_signature;
    double confidence{0.5};             ///< [0, 1]
    double exploration{0.5};            ///< [0, 1], 0 = precise, 1 = exploratory
    std::optional<double> urgency_ms;   ///< Time budget; tight budgets narrow the field
    size_t limit{10};                   ///< Maximum results, > 0

    /// @throws InvalidIntentError describing the first bad parameter
    void Validate() const;
};

/// Session state that adapts field geometry
struct QueryContext {
    struct RecentQuery {
        QueryType type{QueryType::DISCOVERY};
        std::string category;           ///< Empty if the query had no signature
    };

    struct Preferences {
        double exploration_tendency{0.5};
        double precision_requirement{0.5};
    };

    std::vector<RecentQuery> recent_queries;
    double avg_response_ms{100.0};
    double hit_rate{0.7};
    double emergence_frequency{0.0};
    std::optional<Preferences> preferences;
};

/// Ephemeral query-scoped scoring region
struct ProbabilityField {
    Coordinate center;
    double radius{0.35};
    FieldShape shape{FieldShape::SPHERICAL};
    FalloffFunction falloff{FalloffFunction::POLYNOMIAL};
    double amplitude{1.0};
    double steepness{2.0};
    double morphing_rate{0.1};
    double context_sensitivity{0.5};
    double exploration_bias{0.5};

    bool IsValid() const;

    std::string ToString() const;
};

/// Candidate position handed to the field for scoring
struct FieldCandidate {
    PatternID id;
    Coordinate point;
};

/// Scored candidate
struct FieldScore {
    PatternID id;
    double score{0.0};      ///< [0, 1]
    double distance{0.0};
};

class ProbabilityFieldEngine {
public:
    struct Config {
        // Default geometry (used when no type-specific rule applies)
        double default_radius{0.35};
        double default_amplitude{1.0};
        double default_steepness{2.0};

        // precision
        double precision_base_radius{0.1};
        double precision_confidence_span{0.2};
        double precision_amplitude{1.5};
        double precision_steepness{4.0};

        // discovery
        double discovery_base_radius{0.5};
        double discovery_exploration_span{0.3};
        double discovery_amplitude{1.0};
        double discovery_steepness{1.5};

        // creative (uniform ranges)
        double creative_base_radius{0.6};
        double creative_radius_span{0.2};
        double creative_base_amplitude{0.8};
        double creative_amplitude_span{0.4};
        double creative_base_steepness{1.0};
        double creative_steepness_span{2.0};

        // Confidence adjustment
        double low_confidence_threshold{0.3};
        double low_confidence_radius_factor{1.5};
        double low_confidence_amplitude_factor{0.8};
        double high_confidence_threshold{0.8};
        double high_confidence_radius_factor{0.7};
        double high_confidence_amplitude_factor{1.2};

        // Time budget adjustment
        double urgency_threshold_ms{100.0};
        double urgency_radius_factor{0.8};
        double urgency_steepness_factor{1.2};

        // Hit-rate adjustment
        double low_hit_rate{0.5};
        double low_hit_rate_radius_factor{1.2};
        double high_hit_rate{0.9};
        double high_hit_rate_radius_factor{0.9};

        // Morphing rate
        double base_morphing_rate{0.1};
        double creative_morphing_factor{2.0};
        double emergence_threshold{0.7};
        double emergence_morphing_factor{0.8};
        size_t diverse_query_types{2};
        double diverse_morphing_factor{1.3};

        // Context sensitivity
        double base_context_sensitivity{0.5};
        double fast_response_ms{50.0};
        double fast_response_factor{0.8};
        size_t focused_min_queries{3};
        double focused_context_factor{1.5};

        // Shape modifiers
        double ellipse_elongation{0.3};
        size_t fractal_octaves{3};
        double fractal_weight{0.3};
        double adaptive_weight{0.2};

        // Morph / breathing / pulsing
        double morph_radius_step{0.1};
        double morph_center_step{0.05};
        double morph_steepness_step{0.5};
        double min_radius{0.1};
        double max_radius{1.0};
        double min_steepness{0.5};
        double max_steepness{5.0};
        double breathing_amplitude{0.1};
        double pulse_amplitude{0.3};

        /// Seed for exploration sampling; 0 seeds from std::random_device
        uint64_t random_seed{0};

        bool IsValid() const;
    };

    explicit ProbabilityFieldEngine(const CoordinateHasher& hasher);
    ProbabilityFieldEngine(const CoordinateHasher& hasher,
                           const Config& config,
                           std::shared_ptr<spdlog::logger> logger = nullptr);

    // ========================================================================
    // Field construction
    // ========================================================================

    /// Build a field for an intent
    ///
    /// @throws InvalidIntentError if the intent is malformed
    ProbabilityField GenerateField(const QueryIntent& intent, const QueryContext& context);

    double MorphingRate(const QueryIntent& intent, const QueryContext& context) const;

    double ContextSensitivity(const QueryContext& context) const;

    // ========================================================================
    // Scoring
    // ========================================================================

    /// Score of a point under a field, in [0, 1]
    ///
    /// Exactly 0 when the point lies farther than field.radius from the center.
    double CalculateProbability(const Coordinate& point, const ProbabilityField& field) const;

    /// Score candidates, drop zero scores, sort by descending score
    /// (ties by distance, then id)
    std::vector<FieldScore> ScoreCandidates(const ProbabilityField& field,
                                            const std::vector<FieldCandidate>& candidates) const;

    // ========================================================================
    // Session drift
    // ========================================================================

    /// Random perturbation of radius, center and steepness scaled by
    /// field.morphing_rate * delta_time
    ProbabilityField MorphField(const ProbabilityField& field, double delta_time);

    /// Sinusoidal radius/amplitude oscillation
    ProbabilityField ApplyBreathing(const ProbabilityField& field, double time_s,
                                    double rate_hz = 0.1) const;

    /// Periodic amplitude boost
    ProbabilityField ApplyPulsing(const ProbabilityField& field, double time_s,
                                  double rate_hz = 0.2) const;

    /// Band-limited deterministic noise in [-1, 1]
    static double FractalNoise(const Coordinate& point, size_t octaves);

    const Config& GetConfig() const { return config_; }

private:
    Coordinate FieldCenter(const QueryIntent& intent);
    double Uniform(double lo, double hi);

    const CoordinateHasher& hasher_;
    Config config_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace dpcm
