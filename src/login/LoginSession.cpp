#include "LoginSession.hpp"

#include "RawFdUtils.hpp"

namespace cpa {
#define BUF_SIZE (16 * 1024)

const char* loginStatusName(LoginStatus status) {
  switch (status) {
    case LoginStatus::STARTING:
      return "starting";
    case LoginStatus::RUNNING:
      return "running";
    case LoginStatus::WAITING_CALLBACK:
      return "waiting_callback";
    case LoginStatus::NEEDS_INPUT:
      return "needs_input";
    case LoginStatus::OK:
      return "ok";
    case LoginStatus::ERROR:
      return "error";
  }
  return "unknown";
}

LoginSession::LoginSession(const string& _id, const string& _provider,
                           shared_ptr<const OutputClassifier> _classifier,
                           shared_ptr<PseudoTerminalLauncher> _launcher,
                           std::chrono::milliseconds _gracePeriod)
    : id(_id),
      provider(_provider),
      createdAt(std::chrono::steady_clock::now()),
      classifier(_classifier),
      launcher(_launcher),
      gracePeriod(_gracePeriod),
      status(LoginStatus::STARTING),
      promptSearchStart(0),
      completed(false),
      masterFd(-1),
      childPid(-1),
      childReaped(false),
      childWaitStatus(0) {}

LoginSession::~LoginSession() { cancel("Session destroyed"); }

void LoginSession::start(const LaunchRequest& request) {
  {
    std::shared_lock<std::shared_mutex> lock(stateMutex);
    if (status != LoginStatus::STARTING || masterFd >= 0 || completed) {
      throw StartFailure("Session " + id + " was already started");
    }
  }

  LaunchedChild child = launcher->launch(request);
  {
    lock_guard<std::mutex> guard(processMutex);
    childPid = child.pid;
    childReaped = false;
  }
  {
    std::unique_lock<std::shared_mutex> lock(stateMutex);
    masterFd = child.masterFd;
    status = LoginStatus::RUNNING;
  }
  LOG(INFO) << "Login session " << id << " (" << provider << ") started pid "
            << child.pid;

  try {
    lock_guard<std::mutex> guard(readerMutex);
    readerThread = std::thread(&LoginSession::readLoop, this);
  } catch (const std::system_error& se) {
    LOG(ERROR) << "Cannot start reader for session " << id << ": "
               << se.what();
    {
      std::unique_lock<std::shared_mutex> lock(stateMutex);
      completed = true;
      status = LoginStatus::ERROR;
      error = string("Cannot start reader thread: ") + se.what();
    }
    terminateChild();
    cleanup();
    throw StartFailure(string("Cannot start reader thread: ") + se.what());
  }
}

LoginSessionSnapshot LoginSession::getStatus(size_t tailLength) const {
  std::shared_lock<std::shared_mutex> lock(stateMutex);
  LoginSessionSnapshot snapshot;
  snapshot.sessionId = id;
  snapshot.provider = provider;
  snapshot.status = status;
  snapshot.url = detectedUrl;
  snapshot.error = error;
  snapshot.outputTail = utf8Tail(output, tailLength);
  snapshot.needsInput = (status == LoginStatus::NEEDS_INPUT);
  snapshot.inputPrompt = inputPrompt;
  snapshot.completed = completed;
  return snapshot;
}

string LoginSession::getFullOutput() const {
  std::shared_lock<std::shared_mutex> lock(stateMutex);
  return output;
}

bool LoginSession::isCompleted() const {
  std::shared_lock<std::shared_mutex> lock(stateMutex);
  return completed;
}

bool LoginSession::sendInput(const string& text, string* errorMessage) {
  std::unique_lock<std::shared_mutex> lock(stateMutex);
  if (completed) {
    *errorMessage = "Session " + id + " has already completed";
    return false;
  }
  if (masterFd < 0) {
    *errorMessage = "Session " + id + " has no terminal";
    return false;
  }

  string payload = text;
  if (payload.empty() || payload.back() != '\n') {
    payload.push_back('\n');
  }
  try {
    RawFdUtils::writeAll(masterFd, payload.c_str(), payload.length());
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Input delivery to session " << id
                 << " failed: " << re.what();
    *errorMessage = re.what();
    return false;
  }

  VLOG(1) << "Delivered " << payload.length() << " bytes of input to session "
          << id;
  inputPrompt.reset();
  status = LoginStatus::RUNNING;
  promptSearchStart = output.length();
  return true;
}

void LoginSession::handleOutput(const string& bytes) {
  std::unique_lock<std::shared_mutex> lock(stateMutex);
  if (completed) {
    VLOG(4) << "Ignoring " << bytes.length()
            << " bytes for completed session " << id;
    return;
  }
  output.append(decoder.feed(bytes));
  classifyLocked();
}

void LoginSession::classifyLocked() {
  Classification result = classifier->classify(output, promptSearchStart,
                                                detectedUrl.value_or(""));
  if (result.success) {
    LOG(INFO) << "Login session " << id << " reported success";
    status = LoginStatus::OK;
    completed = true;
    inputPrompt.reset();
    return;
  }
  if (result.promptMarker) {
    if (status != LoginStatus::NEEDS_INPUT) {
      LOG(INFO) << "Login session " << id
                << " is waiting for input: " << *result.promptMarker;
    }
    status = LoginStatus::NEEDS_INPUT;
    inputPrompt = result.promptMarker;
    return;
  }
  if (result.url) {
    LOG(INFO) << "Login session " << id << " found url " << *result.url;
    detectedUrl = result.url;
    if (status != LoginStatus::NEEDS_INPUT) {
      status = LoginStatus::WAITING_CALLBACK;
    }
  }
}

void LoginSession::handleChildExit(int waitStatus) {
  std::unique_lock<std::shared_mutex> lock(stateMutex);
  if (completed) {
    return;
  }
  string rest = decoder.flush();
  if (!rest.empty()) {
    output.append(rest);
    classifyLocked();
    if (completed) {
      return;
    }
  }

  completed = true;
  if (waitStatus != -1 && WIFEXITED(waitStatus) &&
      WEXITSTATUS(waitStatus) == 0) {
    LOG(INFO) << "Login session " << id << " exited cleanly";
    status = LoginStatus::OK;
    inputPrompt.reset();
    return;
  }
  status = LoginStatus::ERROR;
  inputPrompt.reset();
  if (waitStatus == -1) {
    error = "Process exit status unavailable";
  } else if (WIFEXITED(waitStatus)) {
    error = "Process exited with code " + to_string(WEXITSTATUS(waitStatus));
  } else if (WIFSIGNALED(waitStatus)) {
    error = "Process killed by signal " + to_string(WTERMSIG(waitStatus));
  } else {
    error = "Process exit status unavailable";
  }
  LOG(INFO) << "Login session " << id << " failed: " << *error;
}

void LoginSession::readLoop() {
  el::Helpers::setThreadName("login-" + id);
  int fd;
  {
    std::shared_lock<std::shared_mutex> lock(stateMutex);
    fd = masterFd;
  }

  char b[BUF_SIZE];
  while (!isCompleted()) {
    int waitStatus;
    if (reapChild(false, &waitStatus)) {
      drainOutput(fd);
      handleChildExit(waitStatus);
      break;
    }
    if (!RawFdUtils::waitForData(fd, POLL_INTERVAL_MS)) {
      continue;
    }
    ssize_t rc = ::read(fd, b, BUF_SIZE);
    int readErrno = GetErrno();  // Save errno before any logging
    if (rc > 0) {
      VLOG(4) << "Read " << rc << " bytes from session " << id;
      handleOutput(string(b, rc));
      continue;
    }
    if (rc == 0 || readErrno == EIO) {
      // The slave side is closed: the child is exiting, waitpid will see it.
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }
    if (readErrno == EAGAIN || readErrno == EWOULDBLOCK ||
        readErrno == EINTR) {
      continue;
    }
    LOG(WARNING) << "Terminal read error in session " << id << ": "
                 << readErrno << " " << strerror(readErrno);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  // A success marker completes the session while the tool may still be
  // shutting down; give it the grace period to exit on its own.
  int waitStatus;
  auto deadline = std::chrono::steady_clock::now() + gracePeriod;
  while (!reapChild(false, &waitStatus) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  terminateChild();
  cleanup();
  VLOG(1) << "Reader for session " << id << " finished";
}

void LoginSession::drainOutput(int fd) {
  char b[BUF_SIZE];
  while (RawFdUtils::waitForData(fd, 0)) {
    ssize_t rc = ::read(fd, b, BUF_SIZE);
    if (rc <= 0) {
      break;
    }
    handleOutput(string(b, rc));
  }
}

bool LoginSession::reapChild(bool block, int* waitStatus) {
  lock_guard<std::mutex> guard(processMutex);
  if (childReaped || childPid <= 0) {
    *waitStatus = childWaitStatus;
    return true;
  }
  int localStatus = 0;
  pid_t rc;
  do {
    rc = ::waitpid(childPid, &localStatus, block ? 0 : WNOHANG);
  } while (rc == -1 && GetErrno() == EINTR);
  if (rc == childPid) {
    childReaped = true;
    childWaitStatus = localStatus;
    *waitStatus = localStatus;
    VLOG(1) << "Reaped pid " << childPid << " of session " << id;
    return true;
  }
  if (rc == -1) {
    // ECHILD: nothing left to wait for.
    LOG(WARNING) << "waitpid for session " << id
                 << " failed: " << strerror(GetErrno());
    childReaped = true;
    childWaitStatus = -1;
    *waitStatus = -1;
    return true;
  }
  return false;
}

void LoginSession::terminateChild() {
  pid_t pid;
  {
    lock_guard<std::mutex> guard(processMutex);
    if (childReaped || childPid <= 0) {
      return;
    }
    pid = childPid;
    // The child leads its own session, signal the whole process group.
    if (::kill(-pid, SIGTERM) == -1 && ::kill(pid, SIGTERM) == -1 &&
        GetErrno() != ESRCH) {
      LOG(WARNING) << "Cannot send SIGTERM to " << pid << ": "
                   << strerror(GetErrno());
    }
  }
  VLOG(1) << "Sent SIGTERM to pid " << pid << " of session " << id;

  int waitStatus;
  auto deadline = std::chrono::steady_clock::now() + gracePeriod;
  while (std::chrono::steady_clock::now() < deadline) {
    if (reapChild(false, &waitStatus)) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  {
    lock_guard<std::mutex> guard(processMutex);
    if (childReaped) {
      return;
    }
    LOG(INFO) << "Pid " << pid << " of session " << id
              << " ignored SIGTERM, sending SIGKILL";
    if (::kill(-pid, SIGKILL) == -1 && ::kill(pid, SIGKILL) == -1 &&
        GetErrno() != ESRCH) {
      LOG(WARNING) << "Cannot send SIGKILL to " << pid << ": "
                   << strerror(GetErrno());
    }
  }
  reapChild(true, &waitStatus);
}

void LoginSession::cancel(const string& reason) {
  {
    std::unique_lock<std::shared_mutex> lock(stateMutex);
    if (!completed) {
      LOG(INFO) << "Cancelling login session " << id << ": " << reason;
      completed = true;
      if (!isTerminalStatus(status)) {
        status = LoginStatus::ERROR;
        error = reason;
      }
      inputPrompt.reset();
    }
  }
  terminateChild();
  joinReader();
  cleanup();
}

void LoginSession::joinReader() {
  lock_guard<std::mutex> guard(readerMutex);
  if (readerThread.joinable() &&
      readerThread.get_id() != std::this_thread::get_id()) {
    readerThread.join();
  }
}

void LoginSession::cleanup() {
  std::unique_lock<std::shared_mutex> lock(stateMutex);
  if (masterFd >= 0) {
    VLOG(1) << "Closing pty " << masterFd << " of session " << id;
    if (::close(masterFd) == -1) {
      LOG(WARNING) << "Closing pty of session " << id
                   << " failed: " << strerror(GetErrno());
    }
    masterFd = -1;
  }
}
}  // namespace cpa
