#include "DaemonConfig.hpp"

#include "TestHeaders.hpp"

using namespace fsn;

TEST_CASE("Defaults without a config file", "[DaemonConfig]") {
  DaemonConfig config;
  REQUIRE(config.monitor.name() == "default");
  REQUIRE(config.monitor.watches_size() == 0);
  REQUIRE(config.monitor.command_timeout_ms() == 1000);
  REQUIRE(config.monitor.mailbox_capacity() == 1024);
  REQUIRE(config.verbose == 0);
  REQUIRE(!config.silent);
  REQUIRE(config.maxlogsize == "20971520");
}

TEST_CASE("Config file sections", "[DaemonConfig]") {
  DaemonConfig config = parseDaemonConfig(
      "[Monitor]\n"
      "name = projects\n"
      "watches = /srv/a, /srv/b ,,/srv/c\n"
      "[Helper]\n"
      "path = /opt/helper\n"
      "args = --poll  --interval 5\n"
      "timeout_ms = 250\n"
      "mailbox_capacity = 16\n"
      "[Debug]\n"
      "verbose = 3\n"
      "silent = 1\n"
      "logsize = 1048576\n");

  REQUIRE(config.monitor.name() == "projects");
  REQUIRE(config.monitor.watches_size() == 3);
  REQUIRE(config.monitor.watches(0) == "/srv/a");
  REQUIRE(config.monitor.watches(1) == "/srv/b");
  REQUIRE(config.monitor.watches(2) == "/srv/c");
  REQUIRE(config.monitor.helper_path() == "/opt/helper");
  REQUIRE(config.monitor.helper_args_size() == 3);
  REQUIRE(config.monitor.helper_args(0) == "--poll");
  REQUIRE(config.monitor.helper_args(2) == "5");
  REQUIRE(config.monitor.command_timeout_ms() == 250);
  REQUIRE(config.monitor.mailbox_capacity() == 16);
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.maxlogsize == "1048576");
}

TEST_CASE("Invalid numbers are rejected", "[DaemonConfig]") {
  REQUIRE_THROWS_AS(parseDaemonConfig("[Helper]\ntimeout_ms = soon\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(parseDaemonConfig("[Helper]\ntimeout_ms = 0\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(parseDaemonConfig("[Helper]\nmailbox_capacity = 12x\n"),
                    std::runtime_error);
}

TEST_CASE("Missing config file", "[DaemonConfig]") {
  REQUIRE_THROWS_AS(loadDaemonConfig("/nonexistent/fsnotifyd.cfg"),
                    std::runtime_error);
}

TEST_CASE("Config lists", "[DaemonConfig]") {
  REQUIRE(splitConfigList(" a , b,,c ", ',') ==
          vector<string>({"a", "b", "c"}));
  REQUIRE(splitConfigList("", ',').empty());
  REQUIRE(splitConfigList("x  y", ' ') == vector<string>({"x", "y"}));
}
