#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace cpa {
ServerConfig ServerConfig::fromEnvironment() {
  ServerConfig config;
  const char* serviceDir = ::getenv("CPA_SERVICE_DIR");
  if (serviceDir) {
    config.serviceDir = string(serviceDir);
  }
  const char* binaryName = ::getenv("CPA_BINARY_NAME");
  if (binaryName && *binaryName) {
    config.binaryName = string(binaryName);
  }
  const char* host = ::getenv("WEBUI_HOST");
  if (host && *host) {
    config.bindIp = string(host);
  }
  const char* port = ::getenv("WEBUI_PORT");
  if (port && *port) {
    config.port = stoi(port);
  }
  return config;
}

void ServerConfig::loadIniFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  const char* value = ini.GetValue("Service", "dir", NULL);
  if (value) {
    serviceDir = string(value);
  }
  value = ini.GetValue("Service", "binary", NULL);
  if (value && *value) {
    binaryName = string(value);
  }

  value = ini.GetValue("Http", "bind_ip", NULL);
  if (value && *value) {
    bindIp = string(value);
  }
  value = ini.GetValue("Http", "port", NULL);
  if (value) {
    port = stoi(value);
  }

  value = ini.GetValue("Login", "max_session_seconds", NULL);
  if (value) {
    maxSessionSeconds = stoi(value);
  }
  value = ini.GetValue("Login", "start_wait_ms", NULL);
  if (value) {
    startWaitMs = stoi(value);
  }

  value = ini.GetValue("Debug", "verbose", NULL);
  if (value) {
    verbose = stoi(value);
  }
  value = ini.GetValue("Debug", "silent", NULL);
  if (value) {
    silent = stoi(value) != 0;
  }
  // make sure maxlogsize is a string of int value
  value = ini.GetValue("Debug", "logsize", NULL);
  if (value && stoi(value) != 0) {
    maxLogSize = string(value);
  }
  value = ini.GetValue("Debug", "logdir", NULL);
  if (value && *value) {
    logDirectory = string(value);
  }
}

string ServerConfig::binaryPath() const {
  return (fs::path(serviceDir) / binaryName).string();
}
}  // namespace cpa
