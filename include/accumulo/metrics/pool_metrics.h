#pragma once

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <chrono>
#include <memory>

namespace accumulo::metrics {

// Connection pool and executor metrics, registered once per executor.
class PoolMetrics {
public:
    explicit PoolMetrics(const std::shared_ptr<prometheus::Registry>& registry);

    void connection_created() { connections_created_.Increment(); }
    void acquire_waited() { acquire_waits_.Increment(); }
    void call_finished(std::chrono::steady_clock::duration elapsed, bool failed);

private:
    prometheus::Counter& connections_created_;
    prometheus::Counter& acquire_waits_;
    prometheus::Counter& calls_;
    prometheus::Counter& call_failures_;
    prometheus::Histogram& call_duration_;
};

}  // namespace accumulo::metrics
