#include "LoginSessionRegistry.hpp"

namespace cpa {
bool LoginSessionRegistry::create(const string& id,
                                  shared_ptr<LoginSession> session) {
  lock_guard<std::mutex> guard(registryMutex);
  const bool inserted = sessions.insert(std::make_pair(id, session)).second;
  if (!inserted) {
    LOG(ERROR) << "Rejecting duplicate login session id " << id;
  }
  return inserted;
}

shared_ptr<LoginSession> LoginSessionRegistry::get(const string& id) const {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return nullptr;
  }
  return it->second;
}

shared_ptr<LoginSession> LoginSessionRegistry::remove(const string& id) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return nullptr;
  }
  auto session = it->second;
  sessions.erase(it);
  return session;
}

vector<string> LoginSessionRegistry::ids() const {
  lock_guard<std::mutex> guard(registryMutex);
  vector<string> retval;
  retval.reserve(sessions.size());
  for (const auto& it : sessions) {
    retval.push_back(it.first);
  }
  return retval;
}

size_t LoginSessionRegistry::size() const {
  lock_guard<std::mutex> guard(registryMutex);
  return sessions.size();
}
}  // namespace cpa
