#include "switchboard/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace switchboard {

namespace {

void render_labeled_counter(std::ostringstream& out,
                            const char* name,
                            const char* help,
                            const char* label,
                            const std::map<std::string, uint64_t>& series) {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    for (const auto& item : series) {
        out << name << "{" << label << "=\"" << item.first << "\"} " << item.second << "\n";
    }
}

void render_counter(std::ostringstream& out, const char* name, const char* help, uint64_t value) {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0};
}

void Metrics::increment_session_created(const std::string& direction) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_created_[direction];
}

void Metrics::increment_session_answered() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_answered_total_;
}

void Metrics::increment_session_finalized(const std::string& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_finalized_[outcome];
}

void Metrics::increment_park() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++parks_total_;
}

void Metrics::increment_unpark() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++unparks_total_;
}

void Metrics::increment_transfer(const std::string& resolution) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++transfers_[resolution];
}

void Metrics::increment_http_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++http_requests_total_;
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& transition) {
    auto& series = transition_histograms_[transition];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_transition(const std::string& transition, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(transition);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    http_requests_total_ = 0;
    sessions_answered_total_ = 0;
    parks_total_ = 0;
    unparks_total_ = 0;
    sessions_created_.clear();
    sessions_finalized_.clear();
    transfers_.clear();
    transition_histograms_.clear();
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    render_counter(out, "switchboard_http_requests_total", "Total number of HTTP requests",
                   http_requests_total_);
    render_labeled_counter(out, "switchboard_sessions_created_total",
                           "Sessions created by direction", "direction", sessions_created_);
    render_counter(out, "switchboard_sessions_answered_total", "Sessions answered by an agent",
                   sessions_answered_total_);
    render_labeled_counter(out, "switchboard_sessions_finalized_total",
                           "Sessions moved to history by outcome", "outcome",
                           sessions_finalized_);
    render_counter(out, "switchboard_parks_total", "Sessions parked", parks_total_);
    render_counter(out, "switchboard_unparks_total", "Sessions unparked", unparks_total_);
    render_labeled_counter(out, "switchboard_transfers_total", "Transfers by resolution",
                           "resolution", transfers_);

    out << "# HELP switchboard_transition_seconds Store transition latency in seconds\n";
    out << "# TYPE switchboard_transition_seconds histogram\n";
    std::vector<std::string> transitions;
    transitions.reserve(transition_histograms_.size());
    for (const auto& item : transition_histograms_) {
        transitions.push_back(item.first);
    }
    std::sort(transitions.begin(), transitions.end());
    for (const auto& transition : transitions) {
        const auto& series = transition_histograms_.at(transition);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "switchboard_transition_seconds_bucket{transition=\"" << transition
                << "\",le=\"" << histogram_bounds_[i] << "\"} " << series.buckets[i] << "\n";
        }
        out << "switchboard_transition_seconds_bucket{transition=\"" << transition
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "switchboard_transition_seconds_count{transition=\"" << transition << "\"} "
            << series.count << "\n";
        out << "switchboard_transition_seconds_sum{transition=\"" << transition << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
