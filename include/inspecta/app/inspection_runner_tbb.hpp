#pragma once

#include <inspecta/app/inspection_runner.hpp>
#include <string>
#include <vector>

#ifdef INSPECTA_HAS_TBB

namespace inspecta::app {

/// Inspects locations in parallel with tbb::parallel_for. Same contract as
/// run_inspection_batch_parallel: one slot per input in input order, callback
/// from TBB worker threads (must be thread-safe), cancellation checked before
/// each image starts.
[[nodiscard]] BatchResult run_inspection_batch_tbb(const InspectionOrchestrator& orchestrator,
                                                   const std::vector<std::string>& locations,
                                                   DecisionRecordCallback callback = {},
                                                   const CancellationToken* cancel = nullptr);

}  // namespace inspecta::app

#endif  // INSPECTA_HAS_TBB
