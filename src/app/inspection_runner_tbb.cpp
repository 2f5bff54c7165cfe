#include <inspecta/app/inspection_runner_tbb.hpp>

#ifdef INSPECTA_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace inspecta::app {

BatchResult run_inspection_batch_tbb(const InspectionOrchestrator& orchestrator,
                                     const std::vector<std::string>& locations,
                                     DecisionRecordCallback callback,
                                     const CancellationToken* cancel) {
  BatchResult results(locations.size());
  if (locations.empty()) return results;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, locations.size()),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          if (cancel && cancel->cancelled()) return;
          results[i].emplace(orchestrator.inspect_url(locations[i]));
          if (callback) callback(i, *results[i]);
        }
      });
  return results;
}

}  // namespace inspecta::app

#endif  // INSPECTA_HAS_TBB
