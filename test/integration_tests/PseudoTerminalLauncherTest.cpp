#include "PseudoTerminalLauncher.hpp"

#include "RawFdUtils.hpp"
#include "TestHeaders.hpp"

using namespace cpa;

namespace {
// Reads the pty until the child side is closed.
string readUntilClosed(int masterFd) {
  string output;
  char buf[1024];
  while (RawFdUtils::waitForData(masterFd, 5000)) {
    ssize_t rc = ::read(masterFd, buf, sizeof(buf));
    if (rc <= 0) {
      break;
    }
    output.append(buf, rc);
  }
  return output;
}

int waitForExit(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
  }
  return status;
}
}  // namespace

TEST_CASE("Child runs on a terminal in the working directory",
          "[PseudoTerminalLauncher]") {
  string directory = makeTempDirectory("cpadash_launch");
  PseudoTerminalLauncher launcher;
  LaunchRequest request;
  request.command = "/bin/sh";
  request.args = {"-c", "pwd -P; if [ -t 0 ]; then echo tty; fi; stty size"};
  request.workingDirectory = directory;

  LaunchedChild child = launcher.launch(request);
  REQUIRE(child.masterFd >= 0);
  REQUIRE(child.pid > 0);

  string output = readUntilClosed(child.masterFd);
  int status = waitForExit(child.pid);
  ::close(child.masterFd);

  REQUIRE(WIFEXITED(status));
  REQUIRE(WEXITSTATUS(status) == 0);
  REQUIRE(output.find(fs::canonical(directory).string()) != string::npos);
  REQUIRE(output.find("tty") != string::npos);
  REQUIRE(output.find("40 200") != string::npos);
  fs::remove_all(directory);
}

TEST_CASE("Commands are looked up on the PATH", "[PseudoTerminalLauncher]") {
  PseudoTerminalLauncher launcher;
  LaunchRequest request;
  request.command = "sh";
  request.args = {"-c", "echo found"};

  LaunchedChild child = launcher.launch(request);
  string output = readUntilClosed(child.masterFd);
  waitForExit(child.pid);
  ::close(child.masterFd);
  REQUIRE(output.find("found") != string::npos);
}

TEST_CASE("Missing binary is a start failure", "[PseudoTerminalLauncher]") {
  PseudoTerminalLauncher launcher;
  LaunchRequest request;
  request.command = "/nonexistent/CLIProxyAPI";
  request.args = {"-login", "-no-browser"};

  try {
    launcher.launch(request);
    FAIL("launch should have thrown");
  } catch (const StartFailure& sf) {
    REQUIRE(string(sf.what()).find("/nonexistent/CLIProxyAPI") !=
            string::npos);
  }
}

TEST_CASE("Missing working directory is a start failure",
          "[PseudoTerminalLauncher]") {
  PseudoTerminalLauncher launcher;
  LaunchRequest request;
  request.command = "/bin/sh";
  request.args = {"-c", "true"};
  request.workingDirectory = "/nonexistent/service/dir";

  REQUIRE_THROWS_AS(launcher.launch(request), StartFailure);
}

TEST_CASE("Empty command is a start failure", "[PseudoTerminalLauncher]") {
  PseudoTerminalLauncher launcher;
  REQUIRE_THROWS_AS(launcher.launch(LaunchRequest()), StartFailure);
}
