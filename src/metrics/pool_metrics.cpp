#include "accumulo/metrics/pool_metrics.h"

namespace accumulo::metrics {

PoolMetrics::PoolMetrics(const std::shared_ptr<prometheus::Registry>& registry)
    : connections_created_(prometheus::BuildCounter()
                               .Name("accumulo_pool_connections_created_total")
                               .Help("Proxy connections opened by the pool")
                               .Register(*registry)
                               .Add({})),
      acquire_waits_(prometheus::BuildCounter()
                         .Name("accumulo_pool_acquire_waits_total")
                         .Help("Acquires that suspended because every connection was borrowed")
                         .Register(*registry)
                         .Add({})),
      calls_(prometheus::BuildCounter()
                 .Name("accumulo_executor_calls_total")
                 .Help("Proxy calls run by the pool executor")
                 .Register(*registry)
                 .Add({})),
      call_failures_(prometheus::BuildCounter()
                         .Name("accumulo_executor_call_failures_total")
                         .Help("Proxy calls that ended with an error other than scanner exhaustion")
                         .Register(*registry)
                         .Add({})),
      call_duration_(prometheus::BuildHistogram()
                         .Name("accumulo_executor_call_duration_seconds")
                         .Help("Proxy call duration in seconds, including the wait for a worker thread")
                         .Register(*registry)
                         .Add({}, prometheus::Histogram::BucketBoundaries{
                                      0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1.0, 5.0})) {}

void PoolMetrics::call_finished(std::chrono::steady_clock::duration elapsed, bool failed) {
    calls_.Increment();
    if (failed) {
        call_failures_.Increment();
    }
    call_duration_.Observe(std::chrono::duration<double>(elapsed).count());
}

}  // namespace accumulo::metrics
