#ifndef __CPA_LOGIN_HTTP_SERVER__
#define __CPA_LOGIN_HTTP_SERVER__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "LoginSupervisor.hpp"
#include "ServerConfig.hpp"

namespace httplib {
class Server;
}

namespace cpa {
/**
 * @brief HTTP front end for the dashboard's account login flow.
 *
 * Routes:
 *  - POST /api/accounts/auth/<provider>   start a login
 *  - GET  /api/accounts/auth/status?state=ID
 *  - GET  /api/accounts/auth/output?state=ID
 *  - POST /api/accounts/auth/input        {"state": ID, "input": TEXT}
 *  - POST /api/accounts/auth/cancel       ?state=ID or {"state": ID}
 *  - GET  /api/providers
 *
 * The handle* methods carry the logic and return the JSON body with the HTTP
 * status in `httpStatus`, so they can be driven without a socket.
 */
class LoginHttpServer {
 public:
  LoginHttpServer(shared_ptr<LoginSupervisor> _supervisor,
                  const ServerConfig& _config);

  ~LoginHttpServer();

  /** @brief Starts the session reaper and serves until `shutdown()`. */
  void run();

  /** @brief Stops serving and cancels every session. */
  void shutdown();

  json handleStart(const string& providerName, int* httpStatus);
  json handleStatus(const string& state, int* httpStatus);
  json handleOutput(const string& state, int* httpStatus);
  json handleInput(const string& state, const string& input, int* httpStatus);
  json handleCancel(const string& state, int* httpStatus);
  json handleProviders(int* httpStatus);

  static json snapshotToJson(const LoginSessionSnapshot& snapshot);

 protected:
  void registerRoutes();
  /** @brief Cancels sessions past their lifetime, once per second. */
  void reapLoop();
  bool isShuttingDown();

  shared_ptr<LoginSupervisor> supervisor;
  ServerConfig config;
  unique_ptr<httplib::Server> server;
  unique_ptr<thread> reaperThread;
  bool shuttingDown;
  recursive_mutex shutdownMutex;
};
}  // namespace cpa

#endif  // __CPA_LOGIN_HTTP_SERVER__
