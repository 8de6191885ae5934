#include "PseudoTerminalLauncher.hpp"

#include "RawFdUtils.hpp"

namespace cpa {
namespace {
enum ChildStage : int {
  STAGE_CHDIR = 1,
  STAGE_EXEC = 2,
};

struct ChildFailure {
  int stage;
  int error;
};

// Only async-signal-safe calls are allowed between fork and exec.
void reportChildFailure(int statusFd, int stage) {
  ChildFailure failure;
  failure.stage = stage;
  failure.error = errno;
  ssize_t unused = ::write(statusFd, &failure, sizeof(failure));
  (void)unused;
}
}  // namespace

LaunchedChild PseudoTerminalLauncher::launch(const LaunchRequest& request) {
  if (request.command.empty()) {
    throw StartFailure("No command specified");
  }

  int statusPipe[2];
  if (::pipe(statusPipe) == -1) {
    throw StartFailure(string("Cannot create status pipe: ") +
                       strerror(GetErrno()));
  }
  RawFdUtils::setCloseOnExec(statusPipe[0]);
  RawFdUtils::setCloseOnExec(statusPipe[1]);

  // Build argv before forking: the child of a multi-threaded parent may only
  // make async-signal-safe calls until it execs.
  vector<char*> argv;
  argv.reserve(request.args.size() + 2);
  argv.push_back(const_cast<char*>(request.command.c_str()));
  for (const auto& arg : request.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  winsize ws;
  memset(&ws, 0, sizeof(winsize));
  ws.ws_row = request.rows;
  ws.ws_col = request.cols;

  int masterFd = -1;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &ws);
  if (pid == -1) {
    int forkErrno = GetErrno();
    ::close(statusPipe[0]);
    ::close(statusPipe[1]);
    throw StartFailure(string("Cannot allocate pseudo-terminal: ") +
                       strerror(forkErrno));
  }
  if (pid == 0) {
    ::close(statusPipe[0]);
    runChild(argv, request.workingDirectory, statusPipe[1]);
  }

  // parent: forkpty already closed the slave end on our side.
  ::close(statusPipe[1]);
  RawFdUtils::setCloseOnExec(masterFd);

  ChildFailure failure;
  ssize_t rc;
  do {
    rc = ::read(statusPipe[0], &failure, sizeof(failure));
  } while (rc == -1 && GetErrno() == EINTR);
  ::close(statusPipe[0]);

  if (rc == 0) {
    // EOF: the status pipe was closed by a successful exec.
    VLOG(1) << "Started " << request.command << " as pid " << pid
            << " on pty " << masterFd;
    return LaunchedChild{masterFd, pid};
  }

  ::close(masterFd);
  int status;
  while (::waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
  }

  if (rc != (ssize_t)sizeof(failure)) {
    throw StartFailure("Lost contact with child while starting " +
                       request.command);
  }
  if (failure.stage == STAGE_CHDIR) {
    throw StartFailure("Cannot change to working directory " +
                       request.workingDirectory + ": " +
                       strerror(failure.error));
  }
  throw StartFailure("Cannot execute " + request.command + ": " +
                     strerror(failure.error));
}

void PseudoTerminalLauncher::runChild(const vector<char*>& argv,
                                      const string& workingDirectory,
                                      int statusFd) {
  if (!workingDirectory.empty() && ::chdir(workingDirectory.c_str()) == -1) {
    reportChildFailure(statusFd, STAGE_CHDIR);
    _exit(126);
  }

  // The server ignores SIGPIPE and blocks its stop signals; the login tool
  // starts with default dispositions and an empty signal mask.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  sigset_t emptyMask;
  sigemptyset(&emptyMask);
  sigprocmask(SIG_SETMASK, &emptyMask, NULL);

  ::execvp(argv[0], const_cast<char* const*>(argv.data()));
  reportChildFailure(statusFd, STAGE_EXEC);
  _exit(127);
}
}  // namespace cpa
