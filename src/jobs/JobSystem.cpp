#include "jobs/JobSystem.h"

#include <spdlog/spdlog.h>

namespace islandgen::jobs {

JobSystem::JobSystem(unsigned workers)
  : _workers(workers == 0 ? 1u : workers)
  , _executor(static_cast<std::size_t>(_workers))
{
  spdlog::debug("JobSystem: started {} worker thread(s)", _workers);
}

JobSystem::~JobSystem()
{
  _executor.wait_for_all();
}

} // namespace islandgen::jobs
