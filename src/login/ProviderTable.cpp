#include "ProviderTable.hpp"

namespace cpa {
const vector<ProviderInfo>& ProviderTable::all() {
  static const vector<ProviderInfo> providers = {
      {"antigravity", "-antigravity-login", 51121},
      {"gemini", "-login", 8085},
      {"codex", "-codex-login", 1455},
      {"claude", "-claude-login", 54545},
      {"qwen", "-qwen-login", 0},
      {"iflow", "-iflow-login", 55998},
  };
  return providers;
}

const ProviderInfo* ProviderTable::find(const string& name) {
  const string lowerName = toLowerAscii(name);
  for (const auto& provider : all()) {
    if (provider.name == lowerName) {
      return &provider;
    }
  }
  return nullptr;
}

vector<string> ProviderTable::names() {
  vector<string> retval;
  for (const auto& provider : all()) {
    retval.push_back(provider.name);
  }
  return retval;
}

LaunchRequest ProviderTable::buildLaunchRequest(const ProviderInfo& provider,
                                                const string& serviceDir,
                                                const string& binaryName) {
  LaunchRequest request;
  request.command = (fs::path(serviceDir) / binaryName).string();
  request.args = {provider.flag, "-no-browser"};
  request.workingDirectory = serviceDir;
  return request;
}
}  // namespace cpa
