#include "LoginHttpServer.hpp"

#include "TestHeaders.hpp"

using namespace cpa;

namespace {
// Stands in for the proxy binary: prints an authorization url, waits for a
// line on stdin and then reports success.
const char* FAKE_LOGIN_SCRIPT =
    "#!/bin/sh\n"
    "echo \"Starting login with $1\"\n"
    "echo 'Visit https://accounts.google.com/o/oauth2/auth?state=abc to "
    "continue'\n"
    "read answer\n"
    "echo \"Got $answer\"\n"
    "echo 'Authentication saved'\n";

const char* FAILING_LOGIN_SCRIPT =
    "#!/bin/sh\n"
    "echo 'config file not found'\n"
    "exit 4\n";

class LoginHttpServerFixture {
 public:
  LoginHttpServerFixture() {
    serviceDir = makeTempDirectory("cpadash_http");
    config.serviceDir = serviceDir;
    config.binaryName = "fake-proxy";
    config.startWaitMs = 5000;
    supervisor = std::make_shared<LoginSupervisor>(
        std::make_shared<OutputClassifier>(),
        std::make_shared<PseudoTerminalLauncher>(),
        std::chrono::milliseconds(500));
  }

  ~LoginHttpServerFixture() {
    server.reset();
    supervisor.reset();
    fs::remove_all(serviceDir);
  }

  void installBinary(const char* script) {
    string path = config.binaryPath();
    std::ofstream out(path);
    out << script;
    out.close();
    fs::permissions(path, fs::perms::owner_all);
  }

  LoginHttpServer& getServer() {
    if (!server) {
      server.reset(new LoginHttpServer(supervisor, config));
    }
    return *server;
  }

  string serviceDir;
  ServerConfig config;
  shared_ptr<LoginSupervisor> supervisor;
  unique_ptr<LoginHttpServer> server;
};
}  // namespace

TEST_CASE_METHOD(LoginHttpServerFixture, "Provider list",
                 "[LoginHttpServer]") {
  int httpStatus = 0;
  json reply = getServer().handleProviders(&httpStatus);
  REQUIRE(httpStatus == 200);
  REQUIRE(reply["providers"].size() == 6);
  REQUIRE(reply["providers"][0]["name"] == "antigravity");
  REQUIRE(reply["providers"][0]["callback_port"] == 51121);
}

TEST_CASE_METHOD(LoginHttpServerFixture, "Unknown provider is rejected",
                 "[LoginHttpServer]") {
  int httpStatus = 0;
  json reply = getServer().handleStart("myspace", &httpStatus);
  REQUIRE(httpStatus == 400);
  REQUIRE(reply["supported"].size() == 6);
  REQUIRE(supervisor->sessionCount() == 0);
}

TEST_CASE_METHOD(LoginHttpServerFixture, "Missing proxy binary is rejected",
                 "[LoginHttpServer]") {
  int httpStatus = 0;
  json reply = getServer().handleStart("gemini", &httpStatus);
  REQUIRE(httpStatus == 400);
  REQUIRE(reply["error"].get<string>().find("fake-proxy") != string::npos);
}

TEST_CASE_METHOD(LoginHttpServerFixture, "Full login flow",
                 "[LoginHttpServer]") {
  installBinary(FAKE_LOGIN_SCRIPT);
  int httpStatus = 0;
  json reply = getServer().handleStart("Gemini", &httpStatus);
  REQUIRE(httpStatus == 200);
  REQUIRE(reply["success"] == true);
  REQUIRE(reply["provider"] == "gemini");
  REQUIRE(reply["callback_port"] == 8085);
  REQUIRE(reply["status"] == "waiting_callback");
  REQUIRE(reply["url"] ==
          "https://accounts.google.com/o/oauth2/auth?state=abc");
  REQUIRE(reply["hint"].get<string>().find("8085") != string::npos);
  const string state = reply["state"].get<string>();

  reply = getServer().handleOutput(state, &httpStatus);
  REQUIRE(httpStatus == 200);
  REQUIRE(reply["output"].get<string>().find("Starting login with -login") !=
          string::npos);

  reply = getServer().handleInput(state, "code-123", &httpStatus);
  REQUIRE(httpStatus == 200);
  REQUIRE(reply["success"] == true);

  REQUIRE(waitUntil([this, &state]() {
    return supervisor->getStatus(state)->completed;
  }));
  reply = getServer().handleStatus(state, &httpStatus);
  REQUIRE(httpStatus == 200);
  REQUIRE(reply["status"] == "ok");
  REQUIRE(reply["completed"] == true);
  REQUIRE(reply["error"].is_null());

  // The final status was delivered, the session is gone now.
  reply = getServer().handleStatus(state, &httpStatus);
  REQUIRE(httpStatus == 404);
  REQUIRE(reply["status"] == "unknown");
}

TEST_CASE_METHOD(LoginHttpServerFixture, "Login that dies at start",
                 "[LoginHttpServer]") {
  installBinary(FAILING_LOGIN_SCRIPT);
  int httpStatus = 0;
  json reply = getServer().handleStart("codex", &httpStatus);
  REQUIRE(httpStatus == 500);
  REQUIRE(reply["success"] == false);
  REQUIRE(reply["status"] == "error");
  REQUIRE(reply["error"] == "Process exited with code 4");
  REQUIRE(reply["output"].get<string>().find("config file not found") !=
          string::npos);
  REQUIRE(supervisor->sessionCount() == 0);
}

TEST_CASE_METHOD(LoginHttpServerFixture, "Cancel through the handlers",
                 "[LoginHttpServer]") {
  installBinary(FAKE_LOGIN_SCRIPT);
  int httpStatus = 0;
  json reply = getServer().handleStart("claude", &httpStatus);
  REQUIRE(httpStatus == 200);
  const string state = reply["state"].get<string>();

  reply = getServer().handleCancel(state, &httpStatus);
  REQUIRE(httpStatus == 200);
  REQUIRE(reply["success"] == true);
  REQUIRE(supervisor->sessionCount() == 0);

  reply = getServer().handleInput(state, "late", &httpStatus);
  REQUIRE(httpStatus == 404);
}

TEST_CASE_METHOD(LoginHttpServerFixture, "Requests without a state",
                 "[LoginHttpServer]") {
  int httpStatus = 0;
  getServer().handleStatus("", &httpStatus);
  REQUIRE(httpStatus == 400);
  getServer().handleOutput("", &httpStatus);
  REQUIRE(httpStatus == 400);
  getServer().handleInput("", "x", &httpStatus);
  REQUIRE(httpStatus == 400);
  getServer().handleCancel("", &httpStatus);
  REQUIRE(httpStatus == 400);

  json reply = getServer().handleStatus("nosuchid", &httpStatus);
  REQUIRE(httpStatus == 404);
  REQUIRE(reply["status"] == "unknown");
}

TEST_CASE("Snapshot wire format", "[LoginHttpServer]") {
  LoginSessionSnapshot snapshot;
  snapshot.sessionId = "abcd1234";
  snapshot.provider = "qwen";
  snapshot.status = LoginStatus::NEEDS_INPUT;
  snapshot.needsInput = true;
  snapshot.inputPrompt = string("请输入");
  snapshot.outputTail = "请输入";

  json body = LoginHttpServer::snapshotToJson(snapshot);
  REQUIRE(body["state"] == "abcd1234");
  REQUIRE(body["provider"] == "qwen");
  REQUIRE(body["status"] == "needs_input");
  REQUIRE(body["needs_input"] == true);
  REQUIRE(body["input_prompt"] == "请输入");
  REQUIRE(body["url"].is_null());
  REQUIRE(body["error"].is_null());
  REQUIRE(body["completed"] == false);
}
