#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

#include "adapters/adapter_registry.hpp"
#include "config/config_loader.hpp"
#include "dispatch/request_dispatcher.hpp"
#include "governor/resource_governor.hpp"
#include "output/output_normalizer.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "server/http_server.hpp"
#include "server/wire_format.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetPidFilePath() {
    return GetHomePath() / ".vizrun" / "server.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    const auto path = GetPidFilePath();
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

bool WaitForExit(pid_t pid, std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!IsProcessRunning(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return !IsProcessRunning(pid);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

vizrun::config::Config LoadAndApplyConfig() {
    auto config = vizrun::config::LoadConfig();
    vizrun::utils::LogConfig log_config;
    log_config.min_level = vizrun::utils::ParseLogLevel(config.logging.level)
                               .value_or(vizrun::utils::LogLevel::kInfo);
    vizrun::utils::SetLogConfig(log_config);
    return config;
}

vizrun::governor::GovernorLimits MakeGovernorLimits(const vizrun::config::Config& config) {
    vizrun::governor::GovernorLimits limits;
    limits.max_workers = static_cast<std::size_t>(config.limits.max_workers);
    limits.policy = vizrun::governor::ParseAdmissionPolicy(config.limits.admission_policy)
                        .value_or(vizrun::governor::AdmissionPolicy::kReject);
    limits.ceilings.timeout = std::chrono::seconds(config.limits.timeout_s);
    limits.ceilings.memory_bytes = static_cast<std::size_t>(config.limits.memory_mb) * 1024 * 1024;
    return limits;
}

// Everything a dispatch needs, wired from one configuration.
struct Service {
    explicit Service(const vizrun::config::Config& config)
        : registry(vizrun::adapters::CreateDefaultRegistry(config.runtimes))
        , governor(MakeGovernorLimits(config))
        , executor(vizrun::sandbox::MakeSandboxLimits(config))
        , normalizer(vizrun::output::MakeNormalizerLimits(config))
        , dispatcher(vizrun::dispatch::MakeDispatcherLimits(config), registry, governor, executor, normalizer) {}

    vizrun::adapters::AdapterRegistry registry;
    vizrun::governor::ResourceGovernor governor;
    vizrun::sandbox::SandboxExecutor executor;
    vizrun::output::OutputNormalizer normalizer;
    vizrun::dispatch::RequestDispatcher dispatcher;
};

int RunServer() {
    const auto config = LoadAndApplyConfig();

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "vizrun server already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();

    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write server pid file." << std::endl;
        return 1;
    }

    Service service(config);
    if (service.registry.List().empty()) {
        vizrun::utils::LogWarn("cli", "no runtime enabled; every request will be rejected");
    }

    // Request bodies may carry JSON escaping on top of the code itself.
    const auto max_body_bytes = config.limits.max_code_length * 2 + 4096;
    vizrun::server::HttpServer http_server(config.server, max_body_bytes, service.dispatcher, service.governor);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed]() {
        if (!http_server.Listen()) {
            listen_failed.store(true);
        }
    });

    std::cout << "vizrun server started on " << config.server.host << ":" << config.server.port
              << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_signal != 0) {
        vizrun::utils::LogInfo("cli", "shutting down", {{"signal", std::to_string(g_signal)}});
    }

    service.governor.Shutdown();
    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    RemovePidFile();
    return listen_failed.load() ? 1 : 0;
}

int StopServer() {
    const auto pid = ReadPidFile();
    if (!pid || !IsProcessRunning(*pid)) {
        std::cout << "vizrun server not running." << std::endl;
        RemovePidFile();
        return 1;
    }
    ::kill(*pid, SIGTERM);
    if (!WaitForExit(*pid, std::chrono::seconds(10))) {
        std::cout << "vizrun server (pid=" << *pid << ") did not exit." << std::endl;
        return 1;
    }
    return 0;
}

int RunSnippet(const std::string& language, const std::string& viz_type, const std::string& file) {
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        std::cout << "Cannot open " << file << std::endl;
        return 1;
    }
    std::ostringstream code;
    code << input.rdbuf();

    const auto config = LoadAndApplyConfig();
    Service service(config);

    vizrun::execution::VisualizationRequest request;
    request.code = code.str();
    request.language = language;
    request.viz_type = viz_type;
    const auto result = service.dispatcher.Dispatch(request);
    std::cout << vizrun::server::DumpJson(vizrun::server::ResultToJson(result)) << std::endl;
    return result.IsArtifact() ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "serve") {
        return RunServer();
    }

    if (argc >= 2 && std::string(argv[1]) == "stop") {
        return StopServer();
    }

    if (argc >= 5 && std::string(argv[1]) == "run") {
        return RunSnippet(argv[2], argv[3], argv[4]);
    }

    std::cout << "Usage: vizrun serve | vizrun stop | vizrun run <language> <viz_type> <file>" << std::endl;
    return 1;
}
