#ifndef __CPA_LOGIN_SESSION_REGISTRY__
#define __CPA_LOGIN_SESSION_REGISTRY__

#include "Headers.hpp"
#include "LoginSession.hpp"

namespace cpa {
/**
 * @brief Thread-safe map from session id to session.
 *
 * Only the map is guarded here; sessions synchronize themselves. Removing a
 * session does not stop it.
 */
class LoginSessionRegistry {
 public:
  /** @return false if the id is already taken. */
  bool create(const string& id, shared_ptr<LoginSession> session);

  /** @return The session, or nullptr if unknown. */
  shared_ptr<LoginSession> get(const string& id) const;

  /** @return The removed session, or nullptr if unknown. */
  shared_ptr<LoginSession> remove(const string& id);

  vector<string> ids() const;

  size_t size() const;

 protected:
  unordered_map<string, shared_ptr<LoginSession>> sessions;
  mutable std::mutex registryMutex;
};
}  // namespace cpa

#endif  // __CPA_LOGIN_SESSION_REGISTRY__
