#include "server/http_server.hpp"

#include <algorithm>
#include <exception>

#include "server/sample_catalog.hpp"
#include "server/wire_format.hpp"
#include "utils/logging.hpp"

namespace vizrun::server {
namespace {

constexpr const char* kJsonType = "application/json";

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(DumpJson(body), kJsonType);
}

}  // namespace

HttpServer::HttpServer(const config::ServerConfig& config,
                       std::size_t max_body_bytes,
                       const dispatch::RequestDispatcher& dispatcher,
                       const governor::ResourceGovernor& governor)
    : host_(config.host)
    , port_(config.port)
    , allowed_origins_(config.allowed_origins)
    , dispatcher_(dispatcher)
    , governor_(governor) {
    const auto threads = static_cast<std::size_t>(std::max(config.threads, 1));
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    server_.set_payload_max_length(max_body_bytes);
    RegisterRoutes();
}

void HttpServer::RegisterRoutes() {
    server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, {{"message", "Visualization API is running"}});
    });

    server_.Get("/samples", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, SamplesToJson(SampleSnippets()));
    });

    server_.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, StatsToJson(governor_.Stats()));
    });

    server_.Post("/generate-visualization", [this](const httplib::Request& req, httplib::Response& res) {
        auto parsed = ParseRequestBody(req.body);
        if (!parsed.Ok()) {
            utils::LogInfo("http", "malformed request", {{"reason", parsed.failure.message}});
            SendJson(res, parsed.failure.http_status, {{"detail", parsed.failure.message}});
            return;
        }
        const auto result = dispatcher_.Dispatch(*parsed.request);
        SendJson(res, HttpStatus(result), ResultToJson(result));
    });

    server_.Options(R"(/.*)", [](const httplib::Request& req, httplib::Response& res) {
        res.status = 204;
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        const auto requested = req.get_header_value("Access-Control-Request-Headers");
        res.set_header("Access-Control-Allow-Headers", requested.empty() ? "Content-Type" : requested);
        res.set_header("Access-Control-Max-Age", "600");
    });

    server_.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        ApplyCors(req, res);
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string error = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& ex) {
            error = ex.what();
        } catch (...) {
            // Logged below with the default description.
        }
        utils::LogError("http", "handler failed", {{"path", req.path}, {"error", error}});
        SendJson(res, 500, {{"detail", execution::kInternalErrorMessage}});
    });
}

void HttpServer::ApplyCors(const httplib::Request& req, httplib::Response& res) const {
    const auto origin = req.get_header_value("Origin");
    if (origin.empty()) {
        return;
    }
    const bool allowed = std::any_of(allowed_origins_.begin(), allowed_origins_.end(),
                                     [&origin](const std::string& candidate) {
                                         return candidate == "*" || candidate == origin;
                                     });
    if (!allowed) {
        return;
    }
    res.set_header("Access-Control-Allow-Origin", origin);
    res.set_header("Access-Control-Allow-Credentials", "true");
    res.set_header("Vary", "Origin");
}

bool HttpServer::Listen() {
    utils::LogInfo("http", "listening", {{"host", host_}, {"port", std::to_string(port_)}});
    const bool ok = server_.listen(host_, port_);
    if (!ok) {
        utils::LogError("http", "failed to listen", {{"host", host_}, {"port", std::to_string(port_)}});
    }
    return ok;
}

int HttpServer::BindToAnyPort() {
    port_ = server_.bind_to_any_port(host_);
    return port_;
}

bool HttpServer::ListenAfterBind() {
    return server_.listen_after_bind();
}

void HttpServer::Stop() {
    server_.stop();
}

bool HttpServer::IsRunning() const {
    return server_.is_running();
}

}  // namespace vizrun::server
