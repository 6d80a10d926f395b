#ifndef __FSN_DAEMON_CONFIG__
#define __FSN_DAEMON_CONFIG__

#include "Headers.hpp"

namespace fsn {
/**
 * @brief Settings for fsnotifyd read from its INI file.
 *
 * Sections are [Monitor] (name, watches), [Helper] (path, args, timeout_ms,
 * mailbox_capacity) and [Debug] (verbose, silent, logsize). Lists are comma
 * separated for watches and whitespace separated for args.
 */
struct DaemonConfig {
  DaemonConfig();

  MonitorOptions monitor;
  int verbose;
  bool silent;
  /** @brief Largest log file in bytes before it is rolled over. */
  string maxlogsize;
};

/**
 * @brief Loads a config file.
 * @throws std::runtime_error if the file cannot be read or a number is
 * invalid.
 */
DaemonConfig loadDaemonConfig(const string& filename);

/** @brief Parses config text, as `loadDaemonConfig` does for a file. */
DaemonConfig parseDaemonConfig(const string& text);

/** @brief Splits on `delim`, trimming items and dropping empty ones. */
vector<string> splitConfigList(const string& value, char delim);
}  // namespace fsn

#endif  // __FSN_DAEMON_CONFIG__
