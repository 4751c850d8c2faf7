#ifndef VOLLEY_REPORT_HPP
#define VOLLEY_REPORT_HPP

#include <atomic>
#include <string>

namespace volley {
    struct ReportSnapshot {
        long total_requests_ = 0;
        long total_success_ = 0;
        long total_fail_ = 0;

        [[nodiscard]] bool is_consistent() const { return total_success_ + total_fail_ == total_requests_; }
    };

    // Run-wide counters shared by every worker.
    class Report {
       public:
        void record_attempt();
        void record_success();
        void record_failure();

        // Fields are read one at a time; only consistent once no worker is in flight.
        [[nodiscard]] ReportSnapshot snapshot() const;

       private:
        std::atomic<long> total_requests_ = 0;
        std::atomic<long> total_success_ = 0;
        std::atomic<long> total_fail_ = 0;
    };

    std::string to_json(const ReportSnapshot& snapshot);

    // Indented rendering printed at the end of a run. Throws json_utils::SerializationError.
    std::string render(const ReportSnapshot& snapshot);
}  // namespace volley

#endif
