#ifndef __CPA_SERVER_CONFIG__
#define __CPA_SERVER_CONFIG__

#include "Headers.hpp"

namespace cpa {
/**
 * @brief Settings of the login server.
 *
 * Sources, lowest precedence first: built-in defaults, the environment
 * variables used by the dashboard scripts (CPA_SERVICE_DIR, CPA_BINARY_NAME,
 * WEBUI_HOST, WEBUI_PORT), an ini file, and finally the command line (applied
 * by the caller).
 */
struct ServerConfig {
  /** @brief Directory holding the proxy binary, also the login cwd. */
  string serviceDir;
  string binaryName = "CLIProxyAPI";
  string bindIp = "127.0.0.1";
  int port = 5000;
  /** @brief Sessions older than this are cancelled. */
  int maxSessionSeconds = 600;
  /** @brief How long a start request waits for a URL or prompt. */
  int startWaitMs = 3000;
  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";
  string logDirectory = GetTempDirectory() + "cpadash";

  /** @brief Defaults overridden by whatever environment variables are set. */
  static ServerConfig fromEnvironment();

  /**
   * @brief Overrides fields with the values present in an ini file.
   * @throws std::runtime_error if the file cannot be loaded.
   * @throws std::invalid_argument if a numeric value is malformed.
   */
  void loadIniFile(const string& path);

  /** @brief Path of the proxy binary inside the service directory. */
  string binaryPath() const;
};
}  // namespace cpa

#endif  // __CPA_SERVER_CONFIG__
