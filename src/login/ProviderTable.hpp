#ifndef __CPA_PROVIDER_TABLE__
#define __CPA_PROVIDER_TABLE__

#include "Headers.hpp"
#include "PseudoTerminalLauncher.hpp"

namespace cpa {
/** @brief How to start one provider's login with the proxy binary. */
struct ProviderInfo {
  string name;
  /** @brief Command line flag that selects the login flow. */
  string flag;
  /** @brief Local OAuth callback port, 0 for device-code flows. */
  int callbackPort;
};

/**
 * @brief The fixed table of login flows the proxy binary supports.
 */
class ProviderTable {
 public:
  static const vector<ProviderInfo>& all();

  /** @brief Case-insensitive lookup, nullptr if unknown. */
  static const ProviderInfo* find(const string& name);

  static vector<string> names();

  /**
   * @brief Command line for `serviceDir/binaryName <flag> -no-browser`, run
   * from the service directory.
   */
  static LaunchRequest buildLaunchRequest(const ProviderInfo& provider,
                                          const string& serviceDir,
                                          const string& binaryName);
};
}  // namespace cpa

#endif  // __CPA_PROVIDER_TABLE__
