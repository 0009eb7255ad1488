#pragma once

/**
 * @file http.hpp
 * @brief HTTP API for stillhere
 *
 * The Router turns transport-neutral requests into commands dispatched on a
 * fresh bus and maps errors to status codes. HttpServer binds the router to
 * cpp-httplib.
 */

#include "stillhere/bootstrap.hpp"
#include "stillhere/stillhere.hpp"

#include <memory>
#include <string>

namespace stillhere {
namespace http {

/// HTTP method
enum class Method { GET, POST, PUT, DELETE_METHOD };

/// HTTP response structure
struct Response {
    int status_code = 0;
    std::string body;
};

/// HTTP request structure
struct Request {
    Method method = Method::GET;
    std::string path;
    std::string body;
};

/// Convert ErrorCode to the HTTP status reported for it
[[nodiscard]] inline int error_code_to_status_code(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return 200;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::InvalidArgument:
            return 400;
        default:
            return 500;
    }
}

/**
 * @brief Routes /api requests onto the message bus
 *
 * Thread-safe: every request builds its own bus.
 */
class Router {
  public:
    explicit Router(Bootstrap& bootstrap) : bootstrap_(bootstrap) {}

    /// Handle one request; never throws
    [[nodiscard]] Response handle(const Request& request) const;

  private:
    Response register_device(const Request& request) const;
    Response remove_device(const std::string& uuid) const;
    Response keep_alive_device(const std::string& uuid) const;
    Response get_device(const std::string& uuid) const;
    Response health() const;

    Bootstrap& bootstrap_;
};

/**
 * @brief HTTP server using cpp-httplib
 */
class HttpServer {
  public:
    HttpServer(Router& router, std::string host, int port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve until stop() is called. Returns false if binding failed.
    bool listen();

    /// Stop a running listen() (safe from another thread)
    void stop();

    [[nodiscard]] bool is_running() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace http
}  // namespace stillhere
