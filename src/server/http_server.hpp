#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "dispatch/request_dispatcher.hpp"
#include "governor/resource_governor.hpp"
#include "httplib.h"

namespace vizrun::server {

class HttpServer {
public:
    HttpServer(const config::ServerConfig& config,
               std::size_t max_body_bytes,
               const dispatch::RequestDispatcher& dispatcher,
               const governor::ResourceGovernor& governor);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until Stop() is called. Returns false when the address cannot be bound.
    bool Listen();

    // For callers that need the port before serving; returns -1 on failure.
    int BindToAnyPort();
    bool ListenAfterBind();

    void Stop();
    bool IsRunning() const;

private:
    void RegisterRoutes();
    void ApplyCors(const httplib::Request& req, httplib::Response& res) const;

    httplib::Server server_;
    std::string host_;
    int port_;
    std::vector<std::string> allowed_origins_;
    const dispatch::RequestDispatcher& dispatcher_;
    const governor::ResourceGovernor& governor_;
};

}  // namespace vizrun::server
