#include "ProcessMetrics.hpp"

namespace pv {
ProcessUsage ProcfsMetricsSource::sampleSelf() {
  rusage usage;
  FATAL_FAIL(getrusage(RUSAGE_SELF, &usage));
  ProcessUsage result;
#if __APPLE__
  result.memoryBytes = usage.ru_maxrss;
#else
  result.memoryBytes = int64_t(usage.ru_maxrss) * 1024;
#endif
  result.cpuMicros =
      int64_t(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000000 +
      usage.ru_utime.tv_usec + usage.ru_stime.tv_usec;
  return result;
}

ProcessUsage ProcfsMetricsSource::sample(pid_t pid) {
  if (pid <= 0) {
    throw std::runtime_error("No pid to sample");
  }
  string procDir = "/proc/" + to_string(pid);
  if (!fs::exists("/proc/self/stat")) {
    if (pid == getpid()) {
      return sampleSelf();
    }
    throw std::runtime_error("procfs is not available");
  }

  ProcessUsage result;
  std::ifstream statusFile(procDir + "/status");
  if (!statusFile.is_open()) {
    throw std::runtime_error("No such process: " + to_string(pid));
  }
  string line;
  while (std::getline(statusFile, line)) {
    if (line.compare(0, 6, "VmRSS:") == 0) {
      std::istringstream iss(line.substr(6));
      int64_t kb = 0;
      iss >> kb;
      result.memoryBytes = kb * 1024;
      break;
    }
  }

  std::ifstream statFile(procDir + "/stat");
  string stat;
  if (!statFile.is_open() || !std::getline(statFile, stat)) {
    throw std::runtime_error("Cannot read " + procDir + "/stat");
  }
  // The command name may contain spaces, so fields are counted from the
  // closing parenthesis: state is field 3, utime 14 and stime 15.
  size_t close = stat.rfind(')');
  if (close == string::npos) {
    throw std::runtime_error("Malformed " + procDir + "/stat");
  }
  std::istringstream fields(stat.substr(close + 2));
  vector<string> tokens;
  string token;
  while (fields >> token) {
    tokens.push_back(token);
  }
  if (tokens.size() < 13) {
    throw std::runtime_error("Malformed " + procDir + "/stat");
  }
  int64_t ticks = stoll(tokens[11]) + stoll(tokens[12]);
  long ticksPerSecond = sysconf(_SC_CLK_TCK);
  if (ticksPerSecond <= 0) {
    ticksPerSecond = 100;
  }
  result.cpuMicros = ticks * 1000000 / ticksPerSecond;
  return result;
}
}  // namespace pv
