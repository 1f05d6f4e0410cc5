#ifndef __PV_PROCESS_METRICS__
#define __PV_PROCESS_METRICS__

#include "Headers.hpp"

namespace pv {
struct ProcessUsage {
  /** @brief Resident set size in bytes. */
  int64_t memoryBytes = 0;
  /** @brief User plus system CPU time in microseconds. */
  int64_t cpuMicros = 0;
};

class ProcessMetricsSource {
 public:
  virtual ~ProcessMetricsSource() {}

  /** @throws std::runtime_error if the process cannot be inspected. */
  virtual ProcessUsage sample(pid_t pid) = 0;
};

/**
 * @brief Reads /proc/<pid>/status and /proc/<pid>/stat.  Where procfs is
 * missing, only the calling process can be sampled (via getrusage).
 */
class ProcfsMetricsSource : public ProcessMetricsSource {
 public:
  virtual ~ProcfsMetricsSource() {}
  virtual ProcessUsage sample(pid_t pid);

 protected:
  ProcessUsage sampleSelf();
};
}  // namespace pv

#endif  // __PV_PROCESS_METRICS__
