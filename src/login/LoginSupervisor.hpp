#ifndef __CPA_LOGIN_SUPERVISOR__
#define __CPA_LOGIN_SUPERVISOR__

#include "Headers.hpp"
#include "LoginSession.hpp"
#include "LoginSessionRegistry.hpp"

namespace cpa {
enum class InputResult {
  DELIVERED,
  FAILED,
  NOT_FOUND,
};

/**
 * @brief Entry point for the boundary layer: creates, queries, feeds and
 * cancels login sessions by id.
 *
 * Constructed once by the server and passed by reference to the HTTP
 * handlers. A failure in one session never affects another.
 */
class LoginSupervisor {
 public:
  explicit LoginSupervisor(
      shared_ptr<const OutputClassifier> _classifier =
          std::make_shared<OutputClassifier>(),
      shared_ptr<PseudoTerminalLauncher> _launcher =
          std::make_shared<PseudoTerminalLauncher>(),
      std::chrono::milliseconds _gracePeriod =
          std::chrono::milliseconds(2000));

  ~LoginSupervisor();

  /**
   * @brief Starts `command args...` in `workingDir` and registers it.
   * @return The new session id.
   * @throws StartFailure if the command could not be started; nothing is
   * registered in that case.
   */
  string createSession(const string& command, const vector<string>& args,
                       const string& workingDir, const string& provider);

  string createSession(const LaunchRequest& request, const string& provider);

  optional<LoginSessionSnapshot> getStatus(
      const string& id,
      size_t tailLength = LoginSession::DEFAULT_TAIL_LENGTH) const;

  optional<string> getFullOutput(const string& id) const;

  InputResult sendInput(const string& id, const string& text,
                        string* errorMessage);

  /** @brief Removes and stops the session. Unknown ids are ignored. */
  void cancel(const string& id);

  /**
   * @brief Removes a session whose final status has been reported and frees
   * its resources.
   * @return false if the id was unknown.
   */
  bool release(const string& id);

  /**
   * @brief Cancels every session older than `maxAge`.
   * @return The ids that were cancelled.
   */
  vector<string> cancelExpired(std::chrono::steady_clock::duration maxAge);

  /** @brief Cancels every session. */
  void shutdown();

  size_t sessionCount() const { return registry.size(); }

 protected:
  string newSessionId() const;

  shared_ptr<const OutputClassifier> classifier;
  shared_ptr<PseudoTerminalLauncher> launcher;
  std::chrono::milliseconds gracePeriod;
  LoginSessionRegistry registry;
};
}  // namespace cpa

#endif  // __CPA_LOGIN_SUPERVISOR__
