#include "DaemonConfig.hpp"

#include "SimpleIni.h"

namespace fsn {
namespace {
int parseNumber(const char* section, const char* key, const char* value) {
  try {
    size_t consumed = 0;
    int number = stoi(value, &consumed);
    if (trim(string(value).substr(consumed)).empty()) {
      return number;
    }
  } catch (const std::logic_error&) {
    // Reported below with the section and key.
  }
  throw std::runtime_error(string("Invalid number for [") + section + "] " +
                           key + ": " + value);
}

void applyIni(const CSimpleIniA& ini, DaemonConfig* config) {
  MonitorOptions* monitor = &config->monitor;

  const char* name = ini.GetValue("Monitor", "name", NULL);
  if (name) {
    monitor->set_name(trim(name));
  }
  const char* watches = ini.GetValue("Monitor", "watches", NULL);
  if (watches) {
    for (const auto& path : splitConfigList(watches, ',')) {
      monitor->add_watches(path);
    }
  }

  const char* helperPath = ini.GetValue("Helper", "path", NULL);
  if (helperPath) {
    monitor->set_helper_path(trim(helperPath));
  }
  const char* helperArgs = ini.GetValue("Helper", "args", NULL);
  if (helperArgs) {
    for (const auto& arg : splitConfigList(helperArgs, ' ')) {
      monitor->add_helper_args(arg);
    }
  }
  const char* timeout = ini.GetValue("Helper", "timeout_ms", NULL);
  if (timeout) {
    int timeoutMs = parseNumber("Helper", "timeout_ms", timeout);
    if (timeoutMs <= 0) {
      throw std::runtime_error("[Helper] timeout_ms must be positive");
    }
    monitor->set_command_timeout_ms(timeoutMs);
  }
  const char* capacity = ini.GetValue("Helper", "mailbox_capacity", NULL);
  if (capacity) {
    int mailboxCapacity = parseNumber("Helper", "mailbox_capacity", capacity);
    if (mailboxCapacity <= 0) {
      throw std::runtime_error("[Helper] mailbox_capacity must be positive");
    }
    monitor->set_mailbox_capacity(mailboxCapacity);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config->verbose = parseNumber("Debug", "verbose", vlevel);
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    config->silent = parseNumber("Debug", "silent", silent) != 0;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && parseNumber("Debug", "logsize", logsize) != 0) {
    // make sure maxlogsize is a string of int value
    config->maxlogsize = trim(logsize);
  }
}
}  // namespace

DaemonConfig::DaemonConfig()
    : verbose(0), silent(false), maxlogsize("20971520") {
  monitor.set_name("default");
}

vector<string> splitConfigList(const string& value, char delim) {
  vector<string> items;
  for (const auto& item : split(value, delim)) {
    string trimmed = trim(item);
    if (!trimmed.empty()) {
      items.push_back(trimmed);
    }
  }
  return items;
}

DaemonConfig loadDaemonConfig(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  DaemonConfig config;
  applyIni(ini, &config);
  LOG(INFO) << "Loaded config " << filename << " for monitor "
            << config.monitor.name();
  return config;
}

DaemonConfig parseDaemonConfig(const string& text) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(text);
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  DaemonConfig config;
  applyIni(ini, &config);
  return config;
}
}  // namespace fsn
