#pragma once

#include <inspecta/app/orchestrator.hpp>
#include <inspecta/app/result_store.hpp>
#include <inspecta/core/decision_record.hpp>
#include <inspecta/core/image_sample.hpp>
#include <atomic>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inspecta::app {

/// Callback for each resolved record with its input index. With the parallel
/// runners it is invoked from worker threads and must be thread-safe.
using DecisionRecordCallback =
    std::function<void(std::size_t index, const core::DecisionRecord& record)>;

/// Cooperative stop for batch runs: images already started finish, no new image starts.
class CancellationToken {
 public:
  void cancel() noexcept { cancelled_.store(true); }
  [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

 private:
  std::atomic<bool> cancelled_{false};
};

/// One slot per input, in input order. Empty slots were never started (cancelled).
using BatchResult = std::vector<std::optional<core::DecisionRecord>>;

/// Inspects each location (URL or path, via the orchestrator's image source) in order.
[[nodiscard]] BatchResult run_inspection_batch(const InspectionOrchestrator& orchestrator,
                                               const std::vector<std::string>& locations,
                                               DecisionRecordCallback callback = {},
                                               const CancellationToken* cancel = nullptr);

/// Same for already loaded samples.
[[nodiscard]] BatchResult run_inspection_batch(const InspectionOrchestrator& orchestrator,
                                               const std::vector<core::ImageSample>& samples,
                                               DecisionRecordCallback callback = {},
                                               const CancellationToken* cancel = nullptr);

/// Bounded worker pool; num_workers 0 = hardware concurrency.
[[nodiscard]] BatchResult run_inspection_batch_parallel(
    const InspectionOrchestrator& orchestrator, const std::vector<std::string>& locations,
    DecisionRecordCallback callback = {}, std::size_t num_workers = 0,
    const CancellationToken* cancel = nullptr);

[[nodiscard]] BatchResult run_inspection_batch_parallel(
    const InspectionOrchestrator& orchestrator, const std::vector<core::ImageSample>& samples,
    DecisionRecordCallback callback = {}, std::size_t num_workers = 0,
    const CancellationToken* cancel = nullptr);

/// A computed record is never lost to a storage failure: both come back.
struct InspectAndStoreResult {
  core::DecisionRecord record;
  std::expected<std::string, core::PersistenceError> stored;
};

[[nodiscard]] InspectAndStoreResult inspect_and_store(const InspectionOrchestrator& orchestrator,
                                                      IResultStore& store, std::string_view location,
                                                      StageTimingCallback* timing_cb = nullptr);

}  // namespace inspecta::app
