#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace vizrun::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int threads = 8;
    std::vector<std::string> allowed_origins = {"http://localhost:3000"};
};

struct LimitsConfig {
    int timeout_s = 30;
    int request_timeout_s = 45;
    int memory_mb = 1024;
    int max_workers = 4;
    std::string admission_policy = "reject";
    std::size_t max_artifact_bytes = 20 * 1024 * 1024;
    std::size_t max_code_length = 100000;
    std::size_t max_diagnostic_bytes = 8192;
};

struct SandboxConfig {
    std::string scratch_root;
    // Private user, pid, network, ipc and mount namespaces per worker.
    bool isolate = true;
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
    std::vector<std::string> pass_env = {
        "R_HOME",
        "R_LIBS",
        "R_LIBS_SITE",
        "R_LIBS_USER",
        "RSTUDIO_PANDOC",
        "PYTHONPATH",
        "PYTHONHOME",
        "LD_LIBRARY_PATH"
    };
    // Host trees visible read-only inside an isolated worker.
    std::vector<std::string> read_only_paths = {
        "/usr", "/bin", "/sbin", "/lib", "/lib32", "/lib64", "/libx32", "/etc", "/opt"
    };
    int max_file_mb = 64;
    int max_open_files = 256;
    int max_processes = 256;
    int poll_interval_ms = 50;
    int kill_grace_ms = 500;
};

struct RuntimeConfig {
    bool enabled = true;
    std::string command;
};

struct RuntimesConfig {
    RuntimeConfig python{true, "python3"};
    RuntimeConfig r{true, "Rscript"};
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    LimitsConfig limits;
    SandboxConfig sandbox;
    RuntimesConfig runtimes;
    LoggingConfig logging;
};

}  // namespace vizrun::config
