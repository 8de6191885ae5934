#include "LoginSupervisor.hpp"

namespace cpa {
LoginSupervisor::LoginSupervisor(
    shared_ptr<const OutputClassifier> _classifier,
    shared_ptr<PseudoTerminalLauncher> _launcher,
    std::chrono::milliseconds _gracePeriod)
    : classifier(_classifier), launcher(_launcher), gracePeriod(_gracePeriod) {}

LoginSupervisor::~LoginSupervisor() { shutdown(); }

string LoginSupervisor::createSession(const string& command,
                                      const vector<string>& args,
                                      const string& workingDir,
                                      const string& provider) {
  LaunchRequest request;
  request.command = command;
  request.args = args;
  request.workingDirectory = workingDir;
  return createSession(request, provider);
}

string LoginSupervisor::createSession(const LaunchRequest& request,
                                      const string& provider) {
  string id = newSessionId();
  auto session = std::make_shared<LoginSession>(id, provider, classifier,
                                                launcher, gracePeriod);
  try {
    session->start(request);
  } catch (const StartFailure& sf) {
    LOG(WARNING) << "Could not start " << provider
                 << " login: " << sf.what();
    throw;
  }

  if (!registry.create(id, session)) {
    session->cancel("Duplicate session id");
    throw StartFailure("Session id " + id + " is already in use");
  }
  return id;
}

optional<LoginSessionSnapshot> LoginSupervisor::getStatus(
    const string& id, size_t tailLength) const {
  auto session = registry.get(id);
  if (!session) {
    return nullopt;
  }
  return session->getStatus(tailLength);
}

optional<string> LoginSupervisor::getFullOutput(const string& id) const {
  auto session = registry.get(id);
  if (!session) {
    return nullopt;
  }
  return session->getFullOutput();
}

InputResult LoginSupervisor::sendInput(const string& id, const string& text,
                                       string* errorMessage) {
  auto session = registry.get(id);
  if (!session) {
    *errorMessage = "Unknown session " + id;
    return InputResult::NOT_FOUND;
  }
  if (!session->sendInput(text, errorMessage)) {
    return InputResult::FAILED;
  }
  return InputResult::DELIVERED;
}

void LoginSupervisor::cancel(const string& id) {
  auto session = registry.remove(id);
  if (!session) {
    VLOG(1) << "Cancel for unknown session " << id;
    return;
  }
  session->cancel();
}

bool LoginSupervisor::release(const string& id) {
  auto session = registry.remove(id);
  if (!session) {
    return false;
  }
  session->cancel("Session released");
  return true;
}

vector<string> LoginSupervisor::cancelExpired(
    std::chrono::steady_clock::duration maxAge) {
  vector<string> expired;
  auto now = std::chrono::steady_clock::now();
  for (const auto& id : registry.ids()) {
    auto session = registry.get(id);
    if (!session || now - session->getCreatedAt() <= maxAge) {
      continue;
    }
    if (registry.remove(id)) {
      LOG(INFO) << "Login session " << id << " exceeded its lifetime";
      session->cancel("Login timed out");
      expired.push_back(id);
    }
  }
  return expired;
}

void LoginSupervisor::shutdown() {
  for (const auto& id : registry.ids()) {
    auto session = registry.remove(id);
    if (session) {
      session->cancel("Server shutting down");
    }
  }
}

string LoginSupervisor::newSessionId() const {
  while (true) {
    string id = sole::uuid4().str().substr(0, 8);
    if (!registry.get(id)) {
      return id;
    }
  }
}
}  // namespace cpa
