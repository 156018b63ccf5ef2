#include "accumulo/pool/pool_executor.h"

#include <spdlog/spdlog.h>

#include "worker/worker_pool.h"

namespace accumulo {

namespace {

std::size_t thread_count_for(const PoolExecutorOptions& options) {
    return options.max_threads == 0 ? options.connection_limit : options.max_threads;
}

}  // namespace

PoolExecutor::PoolExecutor(PoolExecutorOptions options)
    : metrics_(options.metrics_registry ? std::make_unique<metrics::PoolMetrics>(options.metrics_registry)
                                        : nullptr),
      pool_(options.connection_limit, std::move(options.connection_factory)),
      workers_(std::make_unique<worker::WorkerPool>(worker::WorkerPool::Options{
          .thread_count = thread_count_for(options),
          .drain_on_shutdown = true,
          .name = options.name})) {
    pool_.set_metrics(metrics_.get());
    spdlog::info("Pool executor '{}' started: connection limit {}, {} worker threads",
                 options.name, pool_.limit(), workers_->thread_count());
}

PoolExecutor::~PoolExecutor() {
    close();
}

void PoolExecutor::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    spdlog::info("Pool executor closing: waiting for {} active calls", workers_->active());
    workers_->shutdown(/*drain=*/true);
    pool_.teardown();
}

std::size_t PoolExecutor::thread_count() const noexcept {
    return workers_->thread_count();
}

bool PoolExecutor::submit(std::function<void()> task) {
    return workers_->post(std::move(task));
}

void PoolExecutor::record(std::chrono::steady_clock::time_point started, bool failed) {
    if (metrics_) {
        metrics_->call_finished(std::chrono::steady_clock::now() - started, failed);
    }
}

}  // namespace accumulo
