#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchboard {

class Metrics {
public:
    static Metrics& instance();

    void increment_session_created(const std::string& direction);
    void increment_session_answered();
    void increment_session_finalized(const std::string& outcome);
    void increment_park();
    void increment_unpark();
    void increment_transfer(const std::string& resolution);
    void increment_http_request();
    void observe_transition(const std::string& transition, double seconds);
    std::string render_prometheus() const;

    // Clears every series. Tests share the singleton.
    void reset();

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& transition);

    mutable std::mutex mutex_;
    uint64_t http_requests_total_ = 0;
    uint64_t sessions_answered_total_ = 0;
    uint64_t parks_total_ = 0;
    uint64_t unparks_total_ = 0;
    std::map<std::string, uint64_t> sessions_created_;
    std::map<std::string, uint64_t> sessions_finalized_;
    std::map<std::string, uint64_t> transfers_;
    std::unordered_map<std::string, HistogramSeries> transition_histograms_;
    std::vector<double> histogram_bounds_;
};

}
