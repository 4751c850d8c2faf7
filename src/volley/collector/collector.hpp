#ifndef VOLLEY_COLLECTOR_HPP
#define VOLLEY_COLLECTOR_HPP

#include <cstddef>

#include "../models.hpp"

namespace volley {
    enum class CollectorKind { SUCCESS, FAILURE };

    // Logs the outcomes of one burst's channel. Observes every outcome; stops once the channel is closed and empty.
    class Collector {
       public:
        Collector(CollectorKind kind, size_t burst_index, bool verbose);

        // Blocks. Returns the number of outcomes observed.
        size_t drain(OutcomeChannel& channel);

        void log_outcome(const RequestOutcome& outcome);

        [[nodiscard]] size_t observed() const { return observed_; }

       private:
        void log_success(const RequestOutcome& outcome) const;
        void log_error(const RequestOutcome& outcome) const;

        CollectorKind kind_;
        size_t burst_index_;
        bool verbose_;
        size_t observed_ = 0;
    };
}  // namespace volley

#endif
