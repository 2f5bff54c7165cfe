#include <inspecta/app/inspection_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>

namespace inspecta::app {

namespace {

using InspectOne = std::function<core::DecisionRecord(std::size_t index)>;

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

bool stop_requested(const CancellationToken* cancel) {
  return cancel && cancel->cancelled();
}

BatchResult run_sequential(std::size_t n, const InspectOne& inspect_one,
                           const DecisionRecordCallback& callback,
                           const CancellationToken* cancel) {
  BatchResult results(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (stop_requested(cancel)) break;
    results[i].emplace(inspect_one(i));
    if (callback) callback(i, *results[i]);
  }
  return results;
}

BatchResult run_parallel(std::size_t n, const InspectOne& inspect_one,
                         const DecisionRecordCallback& callback, std::size_t num_workers,
                         const CancellationToken* cancel) {
  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return run_sequential(n, inspect_one, callback, cancel);
  }

  BatchResult results(n);
  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  // Every slot is written by exactly one worker.
  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty() || stop_requested(cancel)) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      results[idx].emplace(inspect_one(idx));
      if (callback) callback(idx, *results[idx]);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return results;
}

}  // namespace

BatchResult run_inspection_batch(const InspectionOrchestrator& orchestrator,
                                 const std::vector<std::string>& locations,
                                 DecisionRecordCallback callback,
                                 const CancellationToken* cancel) {
  return run_sequential(
      locations.size(),
      [&](std::size_t i) { return orchestrator.inspect_url(locations[i]); }, callback, cancel);
}

BatchResult run_inspection_batch(const InspectionOrchestrator& orchestrator,
                                 const std::vector<core::ImageSample>& samples,
                                 DecisionRecordCallback callback,
                                 const CancellationToken* cancel) {
  return run_sequential(
      samples.size(), [&](std::size_t i) { return orchestrator.inspect(samples[i]); }, callback,
      cancel);
}

BatchResult run_inspection_batch_parallel(const InspectionOrchestrator& orchestrator,
                                          const std::vector<std::string>& locations,
                                          DecisionRecordCallback callback,
                                          std::size_t num_workers,
                                          const CancellationToken* cancel) {
  return run_parallel(
      locations.size(),
      [&](std::size_t i) { return orchestrator.inspect_url(locations[i]); }, callback,
      num_workers, cancel);
}

BatchResult run_inspection_batch_parallel(const InspectionOrchestrator& orchestrator,
                                          const std::vector<core::ImageSample>& samples,
                                          DecisionRecordCallback callback,
                                          std::size_t num_workers,
                                          const CancellationToken* cancel) {
  return run_parallel(
      samples.size(), [&](std::size_t i) { return orchestrator.inspect(samples[i]); }, callback,
      num_workers, cancel);
}

InspectAndStoreResult inspect_and_store(const InspectionOrchestrator& orchestrator,
                                        IResultStore& store, std::string_view location,
                                        StageTimingCallback* timing_cb) {
  core::DecisionRecord record = orchestrator.inspect_url(location, timing_cb);
  auto stored = store.save(record);
  return InspectAndStoreResult{std::move(record), std::move(stored)};
}

}  // namespace inspecta::app
