#include "report.hpp"

#include <string>

#include "../../utils/json_utils.hpp"

namespace volley {
    void Report::record_attempt() { total_requests_.fetch_add(1, std::memory_order_relaxed); }

    void Report::record_success() { total_success_.fetch_add(1, std::memory_order_relaxed); }

    void Report::record_failure() { total_fail_.fetch_add(1, std::memory_order_relaxed); }

    ReportSnapshot Report::snapshot() const {
        return ReportSnapshot{
            .total_requests_ = total_requests_.load(),
            .total_success_ = total_success_.load(),
            .total_fail_ = total_fail_.load(),
        };
    }

    namespace {
        json_utils::Json to_document(const ReportSnapshot& snapshot) {
            json_utils::Json doc;
            doc["TotalRequests"] = snapshot.total_requests_;
            doc["TotalSuccess"] = snapshot.total_success_;
            doc["TotalFail"] = snapshot.total_fail_;
            return doc;
        }
    }  // namespace

    std::string to_json(const ReportSnapshot& snapshot) { return json_utils::dump(to_document(snapshot)); }

    std::string render(const ReportSnapshot& snapshot) { return json_utils::dump(to_document(snapshot), json_utils::DEFAULT_INDENT); }
}  // namespace volley
