#include "LoginHttpServer.hpp"

#include "ProviderTable.hpp"
#include "httplib.h"

namespace cpa {
namespace {
const size_t START_OUTPUT_TAIL = 500;

void sendJson(httplib::Response& res, int httpStatus, const json& body) {
  res.status = httpStatus;
  res.set_content(body.dump(), "application/json");
}

json parseBody(const httplib::Request& req) {
  if (req.body.empty()) {
    return json::object();
  }
  try {
    json body = json::parse(req.body);
    if (body.is_object()) {
      return body;
    }
  } catch (const json::parse_error& pe) {
    LOG(WARNING) << "Ignoring malformed request body: " << pe.what();
  }
  return json::object();
}

// The session id may come as a query parameter or in a JSON body.
string stateFromRequest(const httplib::Request& req, const json& body) {
  if (req.has_param("state")) {
    return req.get_param_value("state");
  }
  auto it = body.find("state");
  if (it != body.end() && it->is_string()) {
    return it->get<string>();
  }
  return string();
}
}  // namespace

LoginHttpServer::LoginHttpServer(shared_ptr<LoginSupervisor> _supervisor,
                                 const ServerConfig& _config)
    : supervisor(_supervisor),
      config(_config),
      server(new httplib::Server()),
      shuttingDown(false) {
  registerRoutes();
}

LoginHttpServer::~LoginHttpServer() { shutdown(); }

void LoginHttpServer::registerRoutes() {
  // Fixed routes first: the provider route would also match "input" and
  // "cancel".
  server->Post("/api/accounts/auth/input",
               [this](const httplib::Request& req, httplib::Response& res) {
                 json body = parseBody(req);
                 string input;
                 auto it = body.find("input");
                 if (it != body.end() && it->is_string()) {
                   input = it->get<string>();
                 }
                 int httpStatus;
                 json reply = handleInput(stateFromRequest(req, body), input,
                                          &httpStatus);
                 sendJson(res, httpStatus, reply);
               });
  server->Post("/api/accounts/auth/cancel",
               [this](const httplib::Request& req, httplib::Response& res) {
                 int httpStatus;
                 json reply =
                     handleCancel(stateFromRequest(req, parseBody(req)),
                                  &httpStatus);
                 sendJson(res, httpStatus, reply);
               });
  server->Post(R"(/api/accounts/auth/([A-Za-z0-9_-]+))",
               [this](const httplib::Request& req, httplib::Response& res) {
                 int httpStatus;
                 json reply = handleStart(req.matches[1], &httpStatus);
                 sendJson(res, httpStatus, reply);
               });
  server->Get("/api/accounts/auth/status",
              [this](const httplib::Request& req, httplib::Response& res) {
                int httpStatus;
                json reply = handleStatus(req.get_param_value("state"),
                                          &httpStatus);
                sendJson(res, httpStatus, reply);
              });
  server->Get("/api/accounts/auth/output",
              [this](const httplib::Request& req, httplib::Response& res) {
                int httpStatus;
                json reply = handleOutput(req.get_param_value("state"),
                                          &httpStatus);
                sendJson(res, httpStatus, reply);
              });
  server->Get("/api/providers",
              [this](const httplib::Request& req, httplib::Response& res) {
                int httpStatus;
                json reply = handleProviders(&httpStatus);
                sendJson(res, httpStatus, reply);
              });
}

void LoginHttpServer::run() {
  {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    reaperThread.reset(new thread([this]() { reapLoop(); }));
  }
  LOG(INFO) << "Listening on " << config.bindIp << ":" << config.port;
  CLOG(INFO, "stdout") << "Login server listening on http://" << config.bindIp
                       << ":" << config.port << endl;
  if (!server->listen(config.bindIp.c_str(), config.port)) {
    if (!isShuttingDown()) {
      throw std::runtime_error("Cannot listen on " + config.bindIp + ":" +
                               to_string(config.port));
    }
  }
}

void LoginHttpServer::shutdown() {
  {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    if (shuttingDown) {
      return;
    }
    shuttingDown = true;
  }
  server->stop();
  if (reaperThread) {
    reaperThread->join();
    reaperThread.reset();
  }
  supervisor->shutdown();
}

bool LoginHttpServer::isShuttingDown() {
  lock_guard<recursive_mutex> guard(shutdownMutex);
  return shuttingDown;
}

void LoginHttpServer::reapLoop() {
  el::Helpers::setThreadName("session-reaper");
  while (!isShuttingDown()) {
    auto expired = supervisor->cancelExpired(
        std::chrono::seconds(config.maxSessionSeconds));
    if (!expired.empty()) {
      LOG(INFO) << "Cancelled " << expired.size() << " expired login sessions";
    }
    for (int a = 0; a < 10 && !isShuttingDown(); a++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

json LoginHttpServer::handleStart(const string& providerName,
                                  int* httpStatus) {
  const ProviderInfo* provider = ProviderTable::find(providerName);
  if (!provider) {
    *httpStatus = 400;
    return json{{"error", "Unsupported provider: " + providerName},
                {"supported", ProviderTable::names()}};
  }

  const string binaryPath = config.binaryPath();
  if (!fs::exists(binaryPath)) {
    *httpStatus = 400;
    return json{{"error", "Proxy binary not found: " + binaryPath}};
  }

  string id;
  try {
    id = supervisor->createSession(
        ProviderTable::buildLaunchRequest(*provider, config.serviceDir,
                                          config.binaryName),
        provider->name);
  } catch (const StartFailure& sf) {
    *httpStatus = 500;
    return json{{"error", string("Cannot start login: ") + sf.what()}};
  }
  LOG(INFO) << "Started " << provider->name << " login as session " << id;

  // Give the tool a moment to print its URL or first prompt.
  optional<LoginSessionSnapshot> snapshot;
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config.startWaitMs);
  while (true) {
    snapshot = supervisor->getStatus(id, START_OUTPUT_TAIL);
    if (!snapshot || snapshot->url || snapshot->needsInput ||
        snapshot->completed || std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(LoginSession::POLL_INTERVAL_MS));
  }
  if (!snapshot) {
    *httpStatus = 404;
    return json{{"error", "Session disappeared while starting"},
                {"state", id}};
  }

  json reply = snapshotToJson(*snapshot);
  reply["state"] = id;
  reply["callback_port"] = provider->callbackPort;
  if (snapshot->status == LoginStatus::ERROR) {
    *httpStatus = 500;
    reply["success"] = false;
    supervisor->release(id);
    return reply;
  }
  reply["success"] = true;
  if (snapshot->url && provider->callbackPort > 0) {
    const string port = to_string(provider->callbackPort);
    reply["hint"] = "Open the URL in a browser to finish the login. On a "
                    "remote server make sure port " +
                    port + " is reachable, e.g. ssh -L " + port +
                    ":localhost:" + port + " user@server";
  }
  if (snapshot->status == LoginStatus::OK) {
    supervisor->release(id);
  }
  *httpStatus = (snapshot->url || snapshot->needsInput || snapshot->completed)
                    ? 200
                    : 202;
  return reply;
}

json LoginHttpServer::handleStatus(const string& state, int* httpStatus) {
  if (state.empty()) {
    *httpStatus = 400;
    return json{{"error", "Missing state parameter"}};
  }
  auto snapshot = supervisor->getStatus(state);
  if (!snapshot) {
    *httpStatus = 404;
    return json{{"status", "unknown"}, {"error", "Session not found"}};
  }
  if (snapshot->completed && isTerminalStatus(snapshot->status)) {
    // The final status has now been reported, nobody needs the session.
    supervisor->release(state);
  }
  *httpStatus = 200;
  return snapshotToJson(*snapshot);
}

json LoginHttpServer::handleOutput(const string& state, int* httpStatus) {
  if (state.empty()) {
    *httpStatus = 400;
    return json{{"error", "Missing state parameter"}};
  }
  auto output = supervisor->getFullOutput(state);
  if (!output) {
    *httpStatus = 404;
    return json{{"error", "Session not found"}};
  }
  *httpStatus = 200;
  return json{{"state", state}, {"output", *output}};
}

json LoginHttpServer::handleInput(const string& state, const string& input,
                                  int* httpStatus) {
  if (state.empty()) {
    *httpStatus = 400;
    return json{{"error", "Missing state parameter"}};
  }
  string errorMessage;
  switch (supervisor->sendInput(state, input, &errorMessage)) {
    case InputResult::DELIVERED:
      *httpStatus = 200;
      return json{{"success", true}};
    case InputResult::FAILED:
      *httpStatus = 409;
      return json{{"success", false}, {"error", errorMessage}};
    case InputResult::NOT_FOUND:
      *httpStatus = 404;
      return json{{"success", false}, {"error", "Session not found"}};
  }
  *httpStatus = 500;
  return json{{"success", false}, {"error", "Unknown input result"}};
}

json LoginHttpServer::handleCancel(const string& state, int* httpStatus) {
  if (state.empty()) {
    *httpStatus = 400;
    return json{{"error", "Missing state parameter"}};
  }
  supervisor->cancel(state);
  *httpStatus = 200;
  return json{{"success", true}, {"message", "Session cancelled"}};
}

json LoginHttpServer::handleProviders(int* httpStatus) {
  json providers = json::array();
  for (const auto& provider : ProviderTable::all()) {
    providers.push_back(json{{"name", provider.name},
                             {"flag", provider.flag},
                             {"callback_port", provider.callbackPort}});
  }
  *httpStatus = 200;
  return json{{"providers", providers}};
}

json LoginHttpServer::snapshotToJson(const LoginSessionSnapshot& snapshot) {
  json retval;
  retval["state"] = snapshot.sessionId;
  retval["provider"] = snapshot.provider;
  retval["status"] = loginStatusName(snapshot.status);
  retval["url"] = snapshot.url ? json(*snapshot.url) : json(nullptr);
  retval["error"] = snapshot.error ? json(*snapshot.error) : json(nullptr);
  retval["output"] = snapshot.outputTail;
  retval["needs_input"] = snapshot.needsInput;
  retval["input_prompt"] =
      snapshot.inputPrompt ? json(*snapshot.inputPrompt) : json(nullptr);
  retval["completed"] = snapshot.completed;
  return retval;
}
}  // namespace cpa
