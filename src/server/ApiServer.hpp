#ifndef __AT_API_SERVER__
#define __AT_API_SERVER__

#include "AuthGate.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "RateLimiter.hpp"
#include "ServerConfig.hpp"
#include "SessionError.hpp"
#include "SessionManager.hpp"

namespace at {
/**
 * @brief HTTP/JSON front end over the SessionManager.
 *
 * Every request passes CORS handling, the rate limiter and (under /api/)
 * the auth gate before it reaches a route.  SessionError codes map onto
 * HTTP statuses, see httpStatusForError().
 */
class ApiServer {
 public:
  ApiServer(const ServerConfig& _config, shared_ptr<SessionManager> _manager,
            shared_ptr<AuthGate> _authGate,
            shared_ptr<RateLimiter> _rateLimiter);
  ~ApiServer();

  /**
   * @brief Binds the configured address and serves on a background thread.
   * @return The bound port (useful when the configured port is 0).
   * @throws std::runtime_error if the address cannot be bound.
   */
  int start();

  /** @brief Stops accepting requests and joins the server thread. */
  void stop();

  bool isRunning();

  static int httpStatusForError(ErrorCode code);

  static json statusToJson(const SessionStatus& status);

 protected:
  void registerRoutes();
  httplib::Server::HandlerResponse preRoute(const httplib::Request& req,
                                            httplib::Response& res);

  void handleHealth(const httplib::Request& req, httplib::Response& res);
  void handleCreateSession(const httplib::Request& req, httplib::Response& res);
  void handleSendCommand(const httplib::Request& req, httplib::Response& res);
  void handleGetOutput(const httplib::Request& req, httplib::Response& res);
  void handleGetHistory(const httplib::Request& req, httplib::Response& res);
  void handleGetStatus(const httplib::Request& req, httplib::Response& res);
  void handleResize(const httplib::Request& req, httplib::Response& res);
  void handleTerminateSession(const httplib::Request& req,
                              httplib::Response& res);
  void handleListSessions(const httplib::Request& req, httplib::Response& res);

  httplib::Server::Handler guarded(
      void (ApiServer::*handler)(const httplib::Request&, httplib::Response&));

  ServerConfig config;
  shared_ptr<SessionManager> manager;
  shared_ptr<AuthGate> authGate;
  shared_ptr<RateLimiter> rateLimiter;
  unique_ptr<httplib::Server> server;
  std::thread serverThread;
};
}  // namespace at

#endif  // __AT_API_SERVER__
