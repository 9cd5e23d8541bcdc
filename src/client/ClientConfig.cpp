#include "ClientConfig.hpp"

#include "SimpleIni.h"

namespace igv {
namespace {
int parseInt(const string& key, const char* value) {
  try {
    size_t consumed = 0;
    int result = std::stoi(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return result;
  } catch (const std::logic_error&) {
    throw InvalidArgument("Invalid value for " + key + ": " + value);
  }
}
}  // namespace

void validatePort(int port) {
  if (port <= 0 || port > 65535) {
    throw InvalidArgument("Invalid port: " + to_string(port));
  }
}

void loadConfigFile(const string& filename, ClientConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw IgvError("Invalid config file: " + filename);
  }
  LOG(INFO) << "Loading config from " << filename;

  const char* host = ini.GetValue("Connection", "host", NULL);
  if (host) {
    config->host = string(host);
  }
  const char* port = ini.GetValue("Connection", "port", NULL);
  if (port) {
    config->port = parseInt("port", port);
    validatePort(config->port);
  }
  const char* connectTimeout =
      ini.GetValue("Connection", "connect_timeout_ms", NULL);
  if (connectTimeout) {
    config->connectTimeoutMs = parseInt("connect_timeout_ms", connectTimeout);
  }
  const char* responseTimeout =
      ini.GetValue("Connection", "response_timeout_ms", NULL);
  if (responseTimeout) {
    config->responseTimeoutMs =
        parseInt("response_timeout_ms", responseTimeout);
  }

  const char* command = ini.GetValue("Launcher", "command", NULL);
  if (command) {
    config->command = string(command);
  }
  const char* snapshotDir = ini.GetValue("Launcher", "snapshot_dir", NULL);
  if (snapshotDir) {
    config->snapshotDir = string(snapshotDir);
  }
  const char* readyTimeout = ini.GetValue("Launcher", "ready_timeout", NULL);
  if (readyTimeout) {
    config->readyTimeoutSeconds = parseInt("ready_timeout", readyTimeout);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config->verbose = parseInt("verbose", vlevel);
  }
}
}  // namespace igv
