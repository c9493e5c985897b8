// File: src/query/probability_field.cpp
#include "query/probability_field.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace dpcm {

namespace {

constexpr double kPi = 3.14159265358979323846;

bool InUnitRange(double v) {
    return !std::isnan(v) && v >= 0.0 && v <= 1.0;
}

// Hash-style value noise in [-1, 1]
double ValueNoise(double x, double y, double z) {
    double n = std::sin(x * 12.9898 + y * 78.233 + z * 37.719) * 43758.5453;
    return (n - std::floor(n)) * 2.0 - 1.0;
}

} // anonymous namespace

// ============================================================================
// Enum helpers
// ============================================================================

const char* ToString(QueryType type) {
    switch (type) {
        case QueryType::PRECISION: return "precision";
        case QueryType::DISCOVERY: return "discovery";
        case QueryType::CREATIVE: return "creative";
        default: return "unknown";
    }
}

const char* ToString(FieldShape shape) {
    switch (shape) {
        case FieldShape::SPHERICAL: return "spherical";
        case FieldShape::ELLIPTICAL: return "elliptical";
        case FieldShape::ADAPTIVE: return "adaptive";
        case FieldShape::FRACTAL: return "fractal";
        default: return "unknown";
    }
}

const char* ToString(FalloffFunction falloff) {
    switch (falloff) {
        case FalloffFunction::EXPONENTIAL: return "exponential";
        case FalloffFunction::POLYNOMIAL: return "polynomial";
        case FalloffFunction::GAUSSIAN: return "gaussian";
        case FalloffFunction::SIGMOID: return "sigmoid";
        default: return "unknown";
    }
}

std::optional<QueryType> ParseQueryType(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "precision") return QueryType::PRECISION;
    if (lower == "discovery") return QueryType::DISCOVERY;
    if (lower == "creative") return QueryType::CREATIVE;
    return std::nullopt;
}

// ============================================================================
// QueryIntent / ProbabilityField
// ============================================================================

void QueryIntent::Validate() const {
    if (!InUnitRange(confidence)) {
        throw InvalidIntentError("confidence must be within [0, 1]");
    }
    if (!InUnitRange(exploration)) {
        throw InvalidIntentError("exploration must be within [0, 1]");
    }
    if (urgency_ms && (std::isnan(*urgency_ms) || *urgency_ms < 0.0)) {
        throw InvalidIntentError("urgency must be non-negative");
    }
    if (limit == 0) {
        throw InvalidIntentError("limit must be greater than 0");
    }
    if (harmonic_signature && !harmonic_signature->IsValid()) {
        throw InvalidIntentError("harmonic signature out of range");
    }
}

bool ProbabilityField::IsValid() const {
    return !std::isnan(radius) && radius > 0.0 &&
           !std::isnan(amplitude) && amplitude >= 0.0 &&
           !std::isnan(steepness) && steepness > 0.0 &&
           center.IsInRange();
}

std::string ProbabilityField::ToString() const {
    std::ostringstream oss;
    oss << "Field{center=" << center.ToString()
        << ", radius=" << radius
        << ", shape=" << dpcm::ToString(shape)
        << ", falloff=" << dpcm::ToString(falloff)
        << ", amplitude=" << amplitude
        << ", steepness=" << steepness << "}";
    return oss.str();
}

// ============================================================================
// Config
// ============================================================================

bool ProbabilityFieldEngine::Config::IsValid() const {
    if (default_radius <= 0.0 || precision_base_radius <= 0.0 ||
        discovery_base_radius <= 0.0 || creative_base_radius <= 0.0) {
        return false;
    }
    if (precision_confidence_span < 0.0 || discovery_exploration_span < 0.0 ||
        creative_radius_span < 0.0 || creative_amplitude_span < 0.0 ||
        creative_steepness_span < 0.0) {
        return false;
    }
    if (precision_steepness <= 0.0 || discovery_steepness <= 0.0 ||
        creative_base_steepness <= 0.0 || default_steepness <= 0.0) {
        return false;
    }
    if (low_confidence_threshold > high_confidence_threshold) return false;
    if (low_hit_rate > high_hit_rate) return false;
    if (min_radius <= 0.0 || min_radius > max_radius) return false;
    if (min_steepness <= 0.0 || min_steepness > max_steepness) return false;
    if (fractal_octaves == 0) return false;
    if (breathing_amplitude < 0.0 || breathing_amplitude >= 1.0) return false;
    if (pulse_amplitude < 0.0 || pulse_amplitude > 1.0) return false;
    return true;
}

// ============================================================================
// Construction
// ============================================================================

ProbabilityFieldEngine::ProbabilityFieldEngine(const CoordinateHasher& hasher)
    : ProbabilityFieldEngine(hasher, Config{}) {}

ProbabilityFieldEngine::ProbabilityFieldEngine(const CoordinateHasher& hasher,
                                               const Config& config,
                                               std::shared_ptr<spdlog::logger> logger)
    : hasher_(hasher),
      config_(config),
      logger_(logging::OrNull(std::move(logger), "probability_field")) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid ProbabilityFieldEngine configuration");
    }
    if (config_.random_seed != 0) {
        rng_.seed(config_.random_seed);
    } else {
        std::random_device rd;
        rng_.seed((static_cast<uint64_t>(rd()) << 32) | rd());
    }
}

double ProbabilityFieldEngine::Uniform(double lo, double hi) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

// ============================================================================
// Field construction
// ============================================================================

Coordinate ProbabilityFieldEngine::FieldCenter(const QueryIntent& intent) {
    if (intent.harmonic_signature) {
        return hasher_.GenerateSemanticCoordinates(*intent.harmonic_signature);
    }
    // No signature: explore from a uniformly sampled point
    return Coordinate(Uniform(kCoordinateMin, kCoordinateMax),
                      Uniform(kCoordinateMin, kCoordinateMax),
                      Uniform(kCoordinateMin, kCoordinateMax));
}

ProbabilityField ProbabilityFieldEngine::GenerateField(const QueryIntent& intent,
                                                       const QueryContext& context) {
    intent.Validate();

    ProbabilityField field;
    field.center = FieldCenter(intent);
    field.radius = config_.default_radius;
    field.shape = FieldShape::SPHERICAL;
    field.falloff = FalloffFunction::POLYNOMIAL;
    field.amplitude = config_.default_amplitude;
    field.steepness = config_.default_steepness;

    switch (intent.type) {
        case QueryType::PRECISION:
            field.radius = config_.precision_base_radius +
                           (1.0 - intent.confidence) * config_.precision_confidence_span;
            field.shape = FieldShape::SPHERICAL;
            field.falloff = FalloffFunction::EXPONENTIAL;
            field.amplitude = config_.precision_amplitude;
            field.steepness = config_.precision_steepness;
            break;
        case QueryType::DISCOVERY:
            field.radius = config_.discovery_base_radius +
                           intent.exploration * config_.discovery_exploration_span;
            field.shape = FieldShape::ELLIPTICAL;
            field.falloff = FalloffFunction::POLYNOMIAL;
            field.amplitude = config_.discovery_amplitude;
            field.steepness = config_.discovery_steepness;
            break;
        case QueryType::CREATIVE:
            field.radius = config_.creative_base_radius + Uniform(0.0, config_.creative_radius_span);
            field.shape = FieldShape::FRACTAL;
            field.falloff = FalloffFunction::GAUSSIAN;
            field.amplitude = config_.creative_base_amplitude +
                              Uniform(0.0, config_.creative_amplitude_span);
            field.steepness = config_.creative_base_steepness +
                              Uniform(0.0, config_.creative_steepness_span);
            break;
    }

    if (intent.confidence < config_.low_confidence_threshold) {
        field.radius *= config_.low_confidence_radius_factor;
        field.amplitude *= config_.low_confidence_amplitude_factor;
    } else if (intent.confidence > config_.high_confidence_threshold) {
        field.radius *= config_.high_confidence_radius_factor;
        field.amplitude *= config_.high_confidence_amplitude_factor;
    }

    // Tight time budget trades recall for latency
    if (intent.urgency_ms && *intent.urgency_ms < config_.urgency_threshold_ms) {
        field.radius *= config_.urgency_radius_factor;
        field.steepness *= config_.urgency_steepness_factor;
    }

    if (context.hit_rate < config_.low_hit_rate) {
        field.radius *= config_.low_hit_rate_radius_factor;
    } else if (context.hit_rate > config_.high_hit_rate) {
        field.radius *= config_.high_hit_rate_radius_factor;
    }

    field.morphing_rate = MorphingRate(intent, context);
    field.context_sensitivity = ContextSensitivity(context);
    field.exploration_bias = intent.exploration;

    logger_->debug("Generated {} field {}", ToString(intent.type), field.ToString());
    return field;
}

double ProbabilityFieldEngine::MorphingRate(const QueryIntent& intent,
                                            const QueryContext& context) const {
    double rate = config_.base_morphing_rate;
    if (intent.type == QueryType::CREATIVE) {
        rate *= config_.creative_morphing_factor;
    }
    rate *= (1.0 + intent.exploration);
    if (context.emergence_frequency > config_.emergence_threshold) {
        rate *= config_.emergence_morphing_factor;
    }

    std::set<QueryType> types;
    for (const auto& q : context.recent_queries) {
        types.insert(q.type);
    }
    if (types.size() > config_.diverse_query_types) {
        rate *= config_.diverse_morphing_factor;
    }
    return std::min(rate, 1.0);
}

double ProbabilityFieldEngine::ContextSensitivity(const QueryContext& context) const {
    double sensitivity = config_.base_context_sensitivity;

    if (context.preferences) {
        double consistency = std::fabs(context.preferences->exploration_tendency -
                                       context.preferences->precision_requirement);
        sensitivity *= (1.0 + consistency);
    }

    if (context.avg_response_ms < config_.fast_response_ms) {
        sensitivity *= config_.fast_response_factor;
    }

    std::set<std::string> categories;
    size_t with_category = 0;
    for (const auto& q : context.recent_queries) {
        if (!q.category.empty()) {
            categories.insert(q.category);
            ++with_category;
        }
    }
    if (categories.size() == 1 && with_category > config_.focused_min_queries) {
        sensitivity *= config_.focused_context_factor;
    }

    return std::min(sensitivity, 1.0);
}

// ============================================================================
// Scoring
// ============================================================================

double ProbabilityFieldEngine::CalculateProbability(const Coordinate& point,
                                                    const ProbabilityField& field) const {
    double d = Distance(point, field.center);
    if (!(d <= field.radius)) {
        return 0.0;
    }

    const double a = field.amplitude;
    const double k = field.steepness;
    const double r = field.radius;

    double p = 0.0;
    switch (field.falloff) {
        case FalloffFunction::EXPONENTIAL:
            p = a * std::exp(-k * d);
            break;
        case FalloffFunction::POLYNOMIAL:
            p = a * std::pow(1.0 - std::min(d / r, 1.0), k);
            break;
        case FalloffFunction::GAUSSIAN: {
            double sigma = r / (2.0 * k);
            p = a * std::exp(-(d * d) / (2.0 * sigma * sigma));
            break;
        }
        case FalloffFunction::SIGMOID:
            p = a / (1.0 + std::exp((d - r * 0.5) * k));
            break;
    }

    switch (field.shape) {
        case FieldShape::SPHERICAL:
            break;
        case FieldShape::ELLIPTICAL:
            // Elongated along x
            p *= 1.0 + config_.ellipse_elongation * std::fabs(point.x - field.center.x);
            break;
        case FieldShape::FRACTAL: {
            double noise = FractalNoise(point, config_.fractal_octaves);
            p *= (1.0 - config_.fractal_weight) + config_.fractal_weight * noise;
            break;
        }
        case FieldShape::ADAPTIVE:
            p *= (1.0 - config_.adaptive_weight) + config_.adaptive_weight * field.context_sensitivity;
            break;
    }

    if (std::isnan(p)) {
        return 0.0;
    }
    return std::clamp(p, 0.0, 1.0);
}

std::vector<FieldScore> ProbabilityFieldEngine::ScoreCandidates(
    const ProbabilityField& field,
    const std::vector<FieldCandidate>& candidates) const {

    std::vector<FieldScore> scores;
    scores.reserve(candidates.size());
    for (const auto& c : candidates) {
        double s = CalculateProbability(c.point, field);
        if (s > 0.0) {
            scores.push_back(FieldScore{c.id, s, Distance(c.point, field.center)});
        }
    }
    std::sort(scores.begin(), scores.end(), [](const FieldScore& a, const FieldScore& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.id < b.id;
    });
    return scores;
}

double ProbabilityFieldEngine::FractalNoise(const Coordinate& point, size_t octaves) {
    double noise = 0.0;
    double amplitude = 1.0;
    double frequency = 1.0;
    double max_value = 0.0;
    for (size_t i = 0; i < octaves; ++i) {
        noise += amplitude * ValueNoise(point.x * frequency, point.y * frequency, point.z * frequency);
        max_value += amplitude;
        amplitude *= 0.5;
        frequency *= 2.0;
    }
    return max_value > 0.0 ? noise / max_value : 0.0;
}

// ============================================================================
// Session drift
// ============================================================================

ProbabilityField ProbabilityFieldEngine::MorphField(const ProbabilityField& field,
                                                    double delta_time) {
    const double amount = field.morphing_rate * delta_time;
    ProbabilityField morphed = field;

    morphed.radius = std::clamp(field.radius + Uniform(-0.5, 0.5) * config_.morph_radius_step * amount,
                                config_.min_radius, config_.max_radius);

    Coordinate c(field.center.x + Uniform(-0.5, 0.5) * config_.morph_center_step * amount,
                 field.center.y + Uniform(-0.5, 0.5) * config_.morph_center_step * amount,
                 field.center.z + Uniform(-0.5, 0.5) * config_.morph_center_step * amount);
    morphed.center = c.Clamped();

    morphed.steepness = std::clamp(field.steepness + Uniform(-0.5, 0.5) * config_.morph_steepness_step * amount,
                                   config_.min_steepness, config_.max_steepness);
    return morphed;
}

ProbabilityField ProbabilityFieldEngine::ApplyBreathing(const ProbabilityField& field,
                                                        double time_s, double rate_hz) const {
    double phase = std::sin(time_s * rate_hz * 2.0 * kPi);
    ProbabilityField out = field;
    out.radius = field.radius * (1.0 + config_.breathing_amplitude * phase);
    out.amplitude = field.amplitude * (1.0 + config_.breathing_amplitude * 0.5 * phase);
    return out;
}

ProbabilityField ProbabilityFieldEngine::ApplyPulsing(const ProbabilityField& field,
                                                      double time_s, double rate_hz) const {
    double phase = (std::sin(time_s * rate_hz * 2.0 * kPi) + 1.0) / 2.0;
    ProbabilityField out = field;
    out.amplitude = field.amplitude * (1.0 - config_.pulse_amplitude + config_.pulse_amplitude * phase);
    out.steepness = field.steepness * (1.0 + config_.pulse_amplitude * 0.5 * phase);
    return out;
}

} // namespace dpcm
