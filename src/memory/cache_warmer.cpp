// File: src/memory/cache_warmer.cpp
#include "memory/cache_warmer.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace dpcm {

namespace {

constexpr int64_t kMicrosPerHour = 3600LL * 1000000LL;

int64_t FloorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

} // anonymous namespace

int HourOfDay(const Timestamp& t) {
    int64_t hours = FloorDiv(t.ToMicros(), kMicrosPerHour);
    return static_cast<int>(((hours % 24) + 24) % 24);
}

int DayOfWeek(const Timestamp& t) {
    int64_t days = FloorDiv(t.ToMicros(), kMicrosPerHour * 24);
    // 1970-01-01 was a Thursday
    return static_cast<int>((((days + 4) % 7) + 7) % 7);
}

const char* ToString(CacheWarmer::Priority priority) {
    switch (priority) {
        case CacheWarmer::Priority::NORMAL: return "normal";
        case CacheWarmer::Priority::HIGH: return "high";
        case CacheWarmer::Priority::CRITICAL: return "critical";
        default: return "unknown";
    }
}

const char* ToString(CacheWarmer::Strategy strategy) {
    switch (strategy) {
        case CacheWarmer::Strategy::TIME_BASED: return "time_based";
        case CacheWarmer::Strategy::FREQUENCY: return "frequency";
        case CacheWarmer::Strategy::PREDICTIVE: return "predictive";
        default: return "unknown";
    }
}

// ============================================================================
// AccessTracker
// ============================================================================

AccessTracker::AccessTracker(size_t max_recent)
    : max_recent_(max_recent == 0 ? 1 : max_recent) {}

void AccessTracker::RecordAccess(PatternID id, const Timestamp& at) {
    std::lock_guard<std::mutex> lock(mutex_);
    Profile& p = profiles_[id];
    if (p.count == 0) {
        p.first_access = at;
    }
    ++p.count;
    p.last_access = at;
    ++p.by_hour[static_cast<size_t>(HourOfDay(at))];
    ++p.by_day[static_cast<size_t>(DayOfWeek(at))];
    p.recent.push_back(at);
    while (p.recent.size() > max_recent_) {
        p.recent.pop_front();
    }
}

void AccessTracker::Forget(PatternID id) {
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_.erase(id);
}

std::optional<AccessTracker::Profile> AccessTracker::GetProfile(PatternID id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(id);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<PatternID, AccessTracker::Profile>> AccessTracker::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::pair<PatternID, Profile>>(profiles_.begin(), profiles_.end());
}

size_t AccessTracker::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.size();
}

void AccessTracker::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_.clear();
}

// ============================================================================
// CacheWarmer
// ============================================================================

bool CacheWarmer::Config::IsValid() const {
    return max_per_cycle > 0 &&
           batch_size > 0 &&
           predictive_min_confidence >= 0.0 && predictive_min_confidence <= 1.0 &&
           high_priority_share >= 0.0 && high_priority_share <= 1.0 &&
           critical_access_count >= high_access_count &&
           batch_yield.count() >= 0 &&
           cycle_interval.count() > 0 &&
           max_recent_accesses > 0;
}

CacheWarmer::CacheWarmer(HotCache& cache,
                         Loader loader,
                         const Config& config,
                         Clock clock,
                         std::shared_ptr<spdlog::logger> logger)
    : cache_(cache),
      loader_(std::move(loader)),
      config_(config),
      clock_(clock ? std::move(clock) : SystemClock()),
      logger_(logging::OrNull(std::move(logger), "cache_warmer")),
      tracker_(config.max_recent_accesses) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid CacheWarmer configuration");
    }
    if (!loader_) {
        throw std::invalid_argument("CacheWarmer requires a loader");
    }
}

CacheWarmer::~CacheWarmer() {
    Stop();
}

void CacheWarmer::RecordAccess(PatternID id) {
    tracker_.RecordAccess(id, clock_());
}

void CacheWarmer::Forget(PatternID id) {
    tracker_.Forget(id);
    cache_.Remove(id);
}

CacheWarmer::Priority CacheWarmer::FrequencyPriority(uint64_t count) const {
    if (count >= config_.critical_access_count) return Priority::CRITICAL;
    if (count >= config_.high_access_count) return Priority::HIGH;
    return Priority::NORMAL;
}

std::vector<CacheWarmer::Candidate> CacheWarmer::SelectCandidates() const {
    const Timestamp now = clock_();
    const size_t hour = static_cast<size_t>(HourOfDay(now));
    const size_t next_hour = (hour + 1) % 24;
    auto profiles = tracker_.Snapshot();

    auto take_top = [](std::vector<Candidate>& list, size_t limit) {
        std::sort(list.begin(), list.end(), [](const Candidate& a, const Candidate& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.id < b.id;
        });
        if (list.size() > limit) {
            list.resize(limit);
        }
    };

    std::vector<Candidate> time_based;
    std::vector<Candidate> frequency;
    std::vector<Candidate> predictive;

    for (const auto& [id, profile] : profiles) {
        if (profile.count == 0) {
            continue;
        }
        double total = static_cast<double>(profile.count);

        if (profile.by_hour[hour] > 0) {
            double share = profile.by_hour[hour] / total;
            time_based.push_back(Candidate{id, Strategy::TIME_BASED,
                                           share >= config_.high_priority_share ? Priority::HIGH : Priority::NORMAL,
                                           share});
        }

        frequency.push_back(Candidate{id, Strategy::FREQUENCY, FrequencyPriority(profile.count), total});

        double confidence = profile.by_hour[next_hour] / total;
        if (confidence > config_.predictive_min_confidence) {
            predictive.push_back(Candidate{id, Strategy::PREDICTIVE,
                                           confidence >= config_.high_priority_share ? Priority::HIGH : Priority::NORMAL,
                                           confidence});
        }
    }

    take_top(time_based, config_.time_based_limit);
    take_top(frequency, config_.frequency_limit);
    take_top(predictive, config_.predictive_limit);

    // One entry per pattern, keeping its best priority
    std::map<PatternID, Candidate> merged;
    for (const auto* list : {&frequency, &time_based, &predictive}) {
        for (const auto& c : *list) {
            auto it = merged.find(c.id);
            if (it == merged.end() || c.priority > it->second.priority) {
                merged[c.id] = c;
            }
        }
    }

    std::vector<Candidate> result;
    result.reserve(merged.size());
    for (const auto& [id, c] : merged) {
        result.push_back(c);
    }
    std::sort(result.begin(), result.end(), [](const Candidate& a, const Candidate& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });
    if (result.size() > config_.max_per_cycle) {
        result.resize(config_.max_per_cycle);
    }
    return result;
}

CacheWarmer::WarmReport CacheWarmer::WarmCache() {
    std::lock_guard<std::mutex> warm_lock(warm_mutex_);
    auto started = std::chrono::steady_clock::now();

    WarmReport report;
    auto candidates = SelectCandidates();
    report.candidates = candidates.size();

    for (size_t begin = 0; begin < candidates.size(); begin += config_.batch_size) {
        size_t end = std::min(candidates.size(), begin + config_.batch_size);
        for (size_t i = begin; i < end; ++i) {
            const PatternID id = candidates[i].id;
            if (cache_.Contains(id)) {
                ++report.already_cached;
                continue;
            }
            std::optional<Pattern> pattern = loader_(id);
            if (!pattern) {
                ++report.failed;
                continue;
            }
            cache_.Put(id, *pattern);
            ++report.warmed;
        }
        if (end < candidates.size() && config_.batch_yield.count() > 0) {
            std::this_thread::sleep_for(config_.batch_yield);
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    patterns_warmed_.fetch_add(report.warmed, std::memory_order_relaxed);
    cycles_.fetch_add(1, std::memory_order_relaxed);
    total_time_ms_.fetch_add(report.duration.count(), std::memory_order_relaxed);

    logger_->debug("Cache warming: {} candidates, {} warmed, {} already cached, {} failed",
                   report.candidates, report.warmed, report.already_cached, report.failed);
    return report;
}

CacheWarmer::Stats CacheWarmer::GetStats() const {
    Stats stats;
    stats.patterns_warmed = patterns_warmed_.load(std::memory_order_relaxed);
    stats.cycles = cycles_.load(std::memory_order_relaxed);
    stats.total_time = std::chrono::milliseconds(total_time_ms_.load(std::memory_order_relaxed));
    stats.tracked_patterns = tracker_.Size();
    auto cache_stats = cache_.GetStats();
    stats.cache_size = cache_stats.size;
    stats.cache_hit_rate = cache_stats.hit_rate;
    return stats;
}

// ============================================================================
// Background thread
// ============================================================================

void CacheWarmer::Start() {
    if (running_.exchange(true)) {
        return;
    }
    background_thread_ = std::make_unique<std::thread>(&CacheWarmer::BackgroundLoop, this);
}

void CacheWarmer::Stop() {
    {
        // Held so the loop cannot miss the wakeup between its check and its wait
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_cv_.notify_all();
    if (background_thread_ && background_thread_->joinable()) {
        background_thread_->join();
    }
    background_thread_.reset();
}

void CacheWarmer::BackgroundLoop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, config_.cycle_interval, [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }
        WarmCache();
    }
}

} // namespace dpcm
