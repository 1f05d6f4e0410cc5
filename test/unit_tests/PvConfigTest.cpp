#include "PvConfig.hpp"
#include "TestHeaders.hpp"

using namespace pv;

namespace {
string writeConfig(const string& contents) {
  string dirPattern = GetTempDirectory() + string("pv_config_XXXXXXXX");
  string dir = string(mkdtemp(&dirPattern[0]));
  string path = dir + "/ptyvisor.ini";
  std::ofstream out(path);
  out << contents;
  out.close();
  return path;
}
}  // namespace

TEST_CASE("PvConfig defaults when the file is missing", "[PvConfig]") {
  PvConfig config = PvConfig::load("/nonexistent/ptyvisor.ini");
  REQUIRE(config.host.restartDelayMs == 1000);
  REQUIRE(config.host.chunkSize == 1024);
  REQUIRE(config.host.stormThreshold == 2);
  REQUIRE(config.host.stormPattern == "\r\r\x1b[m\x1b[m\x1b[m\x1b[J");
  REQUIRE(config.monitor.intervalMs == 5000);
  REQUIRE(config.monitor.maxMetricsHistory == 100);
  REQUIRE(config.monitor.maxAlertsHistory == 50);
  REQUIRE(config.monitor.thresholds.memoryWarning == 50 * 1024 * 1024);
  REQUIRE(config.bridge.maxReconnectAttempts == 5);
  REQUIRE(config.server.port == 3001);
  REQUIRE_FALSE(config.silent);
}

TEST_CASE("PvConfig reads every section", "[PvConfig]") {
  string path = writeConfig(
      "[Host]\n"
      "restart_delay_ms = 250\n"
      "chunk_size = 512\n"
      "storm_pattern = \\r\\e[J\n"
      "storm_threshold = 4\n"
      "[Monitor]\n"
      "interval_ms = 1000\n"
      "memory_warning_mb = 10\n"
      "latency_critical_ms = 75.5\n"
      "[Bridge]\n"
      "max_reconnect_attempts = 2\n"
      "[Server]\n"
      "port = 8080\n"
      "bind_ip = 127.0.0.1\n"
      "[Debug]\n"
      "verbose = 3\n"
      "silent = 1\n");

  PvConfig config = PvConfig::load(path);
  REQUIRE(config.host.restartDelayMs == 250);
  REQUIRE(config.host.chunkSize == 512);
  REQUIRE(config.host.stormPattern == "\r\x1b[J");
  REQUIRE(config.host.stormThreshold == 4);
  REQUIRE(config.monitor.intervalMs == 1000);
  REQUIRE(config.monitor.thresholds.memoryWarning == 10 * 1024 * 1024);
  REQUIRE(config.monitor.thresholds.latencyCritical == Approx(75.5));
  REQUIRE(config.bridge.maxReconnectAttempts == 2);
  REQUIRE(config.server.port == 8080);
  REQUIRE(config.server.bindIp == "127.0.0.1");
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);

  fs::remove_all(fs::path(path).parent_path());
}

TEST_CASE("PvConfig rejects malformed numbers", "[PvConfig]") {
  string path = writeConfig("[Host]\nrestart_delay_ms = soon\n");
  REQUIRE_THROWS_AS(PvConfig::load(path), std::runtime_error);
  fs::remove_all(fs::path(path).parent_path());
}

TEST_CASE("PvConfig unescape", "[PvConfig]") {
  REQUIRE(PvConfig::unescape("plain") == "plain");
  REQUIRE(PvConfig::unescape("\\r\\n\\t") == "\r\n\t");
  REQUIRE(PvConfig::unescape("\\e[m") == "\x1b[m");
  REQUIRE(PvConfig::unescape("\\x1b\\x41") == "\x1b" "A");
  REQUIRE(PvConfig::unescape("a\\\\b") == "a\\b");
  REQUIRE(PvConfig::unescape("\\q") == "\\q");
  REQUIRE(PvConfig::unescape("trailing\\") == "trailing\\");
  REQUIRE_THROWS(PvConfig::unescape("\\xzz"));
}

TEST_CASE("PvConfig unescape with high bytes after \\x", "[PvConfig]") {
  // Bytes above 0x7f are negative as plain char.
  REQUIRE(PvConfig::unescape("\\x4\xc3\xa9") == "\x04\xc3\xa9");
  REQUIRE_THROWS(PvConfig::unescape("\\x\xff"));
  REQUIRE(PvConfig::unescape("caf\xc3\xa9\\x41") == "caf\xc3\xa9" "A");
}
