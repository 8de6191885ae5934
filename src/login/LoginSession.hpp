#ifndef __CPA_LOGIN_SESSION__
#define __CPA_LOGIN_SESSION__

#include "Headers.hpp"
#include "OutputClassifier.hpp"
#include "PseudoTerminalLauncher.hpp"
#include "TerminalTextDecoder.hpp"

namespace cpa {
enum class LoginStatus {
  STARTING,
  RUNNING,
  WAITING_CALLBACK,
  NEEDS_INPUT,
  OK,
  ERROR,
};

/** @brief Wire name of a status, e.g. `waiting_callback`. */
const char* loginStatusName(LoginStatus status);

inline bool isTerminalStatus(LoginStatus status) {
  return status == LoginStatus::OK || status == LoginStatus::ERROR;
}

/** @brief Point-in-time copy of a session's observable state. */
struct LoginSessionSnapshot {
  string sessionId;
  string provider;
  LoginStatus status = LoginStatus::STARTING;
  optional<string> url;
  optional<string> error;
  string outputTail;
  bool needsInput = false;
  optional<string> inputPrompt;
  bool completed = false;
};

/**
 * @brief Supervises one interactive login command running on a pty.
 *
 * `start` launches the child and a reader thread. The reader polls the master
 * descriptor (bounded by POLL_INTERVAL_MS so child exit is noticed even when
 * the child is silent), decodes output and runs the classifier under the
 * exclusive lock. Queries take the shared lock and return copies.
 *
 * The session owns the master descriptor and the child pid. Both are
 * released exactly once, by whichever of the reader thread's exit or
 * `cancel()` gets there first; `cancel()` is safe to call any number of times
 * and from any thread except the reader itself.
 */
class LoginSession {
 public:
  static constexpr size_t DEFAULT_TAIL_LENGTH = 2000;
  static constexpr int POLL_INTERVAL_MS = 100;

  LoginSession(const string& _id, const string& _provider,
               shared_ptr<const OutputClassifier> _classifier,
               shared_ptr<PseudoTerminalLauncher> _launcher =
                   std::make_shared<PseudoTerminalLauncher>(),
               std::chrono::milliseconds _gracePeriod =
                   std::chrono::milliseconds(2000));

  virtual ~LoginSession();

  /**
   * @brief Launches the command and the reader thread.
   * @throws StartFailure if the pty or child could not be started. The
   * session then holds no OS resources.
   */
  void start(const LaunchRequest& request);

  LoginSessionSnapshot getStatus(
      size_t tailLength = DEFAULT_TAIL_LENGTH) const;

  string getFullOutput() const;

  /**
   * @brief Types `text` (plus a newline if missing) into the child's terminal.
   * @param errorMessage Receives the reason when delivery fails.
   * @return false if the session is completed or the write failed; the
   * session state is untouched in that case.
   */
  bool sendInput(const string& text, string* errorMessage);

  /**
   * @brief Stops the session: marks it completed, sends SIGTERM, escalates
   * to SIGKILL after the grace period, joins the reader and closes the pty.
   * @param reason Error recorded if the session had not finished yet.
   */
  void cancel(const string& reason = "Login cancelled");

  /**
   * @brief Appends raw terminal bytes and re-runs the classifier. Called by
   * the reader thread; exposed so captured output can be replayed.
   */
  void handleOutput(const string& bytes);

  /** @brief Finalizes the status from a waitpid() status. */
  void handleChildExit(int waitStatus);

  bool isCompleted() const;

  const string& getId() const { return id; }

  const string& getProvider() const { return provider; }

  std::chrono::steady_clock::time_point getCreatedAt() const {
    return createdAt;
  }

 protected:
  void readLoop();
  /** @brief Reads whatever is still buffered in the pty without waiting. */
  void drainOutput(int fd);
  /** @brief Applies a classification result. Caller holds the write lock. */
  void classifyLocked();
  /**
   * @brief waitpid() wrapper that remembers the child was reaped.
   * @return true if the child is gone, with its status in `waitStatus`.
   */
  bool reapChild(bool block, int* waitStatus);
  void terminateChild();
  void joinReader();
  /** @brief Closes the master descriptor. Idempotent. */
  void cleanup();

  const string id;
  const string provider;
  const std::chrono::steady_clock::time_point createdAt;
  shared_ptr<const OutputClassifier> classifier;
  shared_ptr<PseudoTerminalLauncher> launcher;
  std::chrono::milliseconds gracePeriod;

  /** @brief Guards every field below down to `masterFd`. */
  mutable std::shared_mutex stateMutex;
  LoginStatus status;
  TerminalTextDecoder decoder;
  string output;
  /** @brief Output before this offset was already answered with input. */
  size_t promptSearchStart;
  optional<string> detectedUrl;
  optional<string> inputPrompt;
  optional<string> error;
  bool completed;
  int masterFd;

  /** @brief Guards the child pid and reap state. */
  mutable std::mutex processMutex;
  pid_t childPid;
  bool childReaped;
  int childWaitStatus;

  std::mutex readerMutex;
  std::thread readerThread;
};
}  // namespace cpa

#endif  // __CPA_LOGIN_SESSION__
