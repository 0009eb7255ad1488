#include "stillhere/http.hpp"
#include "stillhere/logger.hpp"

#include <httplib.h>

#include <chrono>

namespace stillhere {
namespace http {

// ==================== HttpServer Implementation ====================

class HttpServer::Impl {
  public:
    Impl(Router& router, std::string host, int port)
        : router_(router), host_(std::move(host)), port_(port) {
        const char* any_path = R"(/.*)";

        server_.Get(any_path, [this](const httplib::Request& req, httplib::Response& res) {
            serve(Method::GET, req, res);
        });
        server_.Post(any_path, [this](const httplib::Request& req, httplib::Response& res) {
            serve(Method::POST, req, res);
        });
        server_.Put(any_path, [this](const httplib::Request& req, httplib::Response& res) {
            serve(Method::PUT, req, res);
        });
        server_.Delete(any_path, [this](const httplib::Request& req, httplib::Response& res) {
            serve(Method::DELETE_METHOD, req, res);
        });
    }

    bool listen() {
        STILLHERE_LOG_INFO("listening on {}:{}", host_, port_);
        if (!server_.listen(host_, port_)) {
            STILLHERE_LOG_ERROR("failed to bind {}:{}", host_, port_);
            return false;
        }
        return true;
    }

    void stop() { server_.stop(); }

    bool is_running() const { return server_.is_running(); }

  private:
    void serve(Method method, const httplib::Request& req, httplib::Response& res) {
        auto started = std::chrono::steady_clock::now();

        Request request;
        request.method = method;
        request.path = req.path;
        request.body = req.body;

        Response response = router_.handle(request);
        res.status = response.status_code;
        res.set_content(response.body, "application/json");

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                           std::chrono::steady_clock::now() - started)
                           .count();
        STILLHERE_LOG_DEBUG("{} {} -> {} ({} us)", req.method, req.path, res.status, elapsed);
    }

    Router& router_;
    std::string host_;
    int port_;
    httplib::Server server_;
};

// ==================== HttpServer Public Interface ====================

HttpServer::HttpServer(Router& router, std::string host, int port)
    : impl_(std::make_unique<Impl>(router, std::move(host), port)) {}

HttpServer::~HttpServer() = default;

bool HttpServer::listen() { return impl_->listen(); }

void HttpServer::stop() { impl_->stop(); }

bool HttpServer::is_running() const { return impl_->is_running(); }

}  // namespace http
}  // namespace stillhere
