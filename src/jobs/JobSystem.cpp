#include "tribe/jobs/JobSystem.hpp"

namespace tribe::jobs {

JobSystem& JobSystem::Instance()
{
  static JobSystem s_instance;
  return s_instance;
}

} // namespace tribe::jobs
