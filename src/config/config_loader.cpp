#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace vizrun::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyBool(bool& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

template <typename T>
void ApplyPositive(T& target, const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || !source[key].is_number_integer()) {
        return;
    }
    const auto value = source[key].get<long long>();
    if (value <= 0) {
        utils::LogWarn("config", "ignoring non-positive value", {{"key", key}});
        return;
    }
    target = static_cast<T>(value);
}

void ApplyStringList(std::vector<std::string>& target, const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ApplyRuntimeConfig(RuntimeConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ApplyBool(target.enabled, source, "enabled");
    ApplyString(target.command, source, "command");
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ApplyString(config.server.host, server, "host");
        ApplyPositive(config.server.port, server, "port");
        ApplyPositive(config.server.threads, server, "threads");
        ApplyStringList(config.server.allowed_origins, server, "allowedOrigins");
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        ApplyPositive(config.limits.timeout_s, limits, "timeoutS");
        ApplyPositive(config.limits.request_timeout_s, limits, "requestTimeoutS");
        ApplyPositive(config.limits.memory_mb, limits, "memoryMb");
        ApplyPositive(config.limits.max_workers, limits, "maxWorkers");
        ApplyString(config.limits.admission_policy, limits, "admissionPolicy");
        ApplyPositive(config.limits.max_artifact_bytes, limits, "maxArtifactBytes");
        ApplyPositive(config.limits.max_code_length, limits, "maxCodeLength");
        ApplyPositive(config.limits.max_diagnostic_bytes, limits, "maxDiagnosticBytes");
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ApplyString(config.sandbox.scratch_root, sandbox, "scratchRoot");
        ApplyBool(config.sandbox.isolate, sandbox, "isolate");
        ApplyString(config.sandbox.search_path, sandbox, "searchPath");
        ApplyStringList(config.sandbox.pass_env, sandbox, "passEnv");
        ApplyStringList(config.sandbox.read_only_paths, sandbox, "readOnlyPaths");
        ApplyPositive(config.sandbox.max_file_mb, sandbox, "maxFileMb");
        ApplyPositive(config.sandbox.max_open_files, sandbox, "maxOpenFiles");
        ApplyPositive(config.sandbox.max_processes, sandbox, "maxProcesses");
        ApplyPositive(config.sandbox.poll_interval_ms, sandbox, "pollIntervalMs");
        ApplyPositive(config.sandbox.kill_grace_ms, sandbox, "killGraceMs");
    }

    if (data.contains("runtimes") && data["runtimes"].is_object()) {
        const auto& runtimes = data["runtimes"];
        if (runtimes.contains("python")) {
            ApplyRuntimeConfig(config.runtimes.python, runtimes["python"]);
        }
        if (runtimes.contains("r")) {
            ApplyRuntimeConfig(config.runtimes.r, runtimes["r"]);
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

long long ParsePositive(const std::string& name, const std::string& value, long long fallback) {
    try {
        const auto parsed = std::stoll(value);
        if (parsed > 0) {
            return parsed;
        }
    } catch (const std::exception&) {
        // reported below
    }
    utils::LogWarn("config", "ignoring invalid numeric override", {{"name", name}, {"value", value}});
    return fallback;
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void OverrideString(std::string& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void OverrideBool(bool& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

template <typename T>
void OverridePositive(T& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = static_cast<T>(ParsePositive(primary, value, static_cast<long long>(target)));
    }
}

void OverrideList(std::vector<std::string>& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = SplitCsv(value);
    }
}

void ApplyConfigFromEnv(Config& config) {
    OverrideString(config.server.host, "VIZRUN_SERVER__HOST", "VIZRUN_SERVER_HOST");
    OverridePositive(config.server.port, "VIZRUN_SERVER__PORT", "VIZRUN_SERVER_PORT");
    OverridePositive(config.server.threads, "VIZRUN_SERVER__THREADS", "VIZRUN_SERVER_THREADS");
    OverrideList(config.server.allowed_origins,
                 "VIZRUN_SERVER__ALLOWED_ORIGINS",
                 "VIZRUN_SERVER_ALLOWED_ORIGINS");

    OverridePositive(config.limits.timeout_s, "VIZRUN_LIMITS__TIMEOUT_S", "VIZRUN_LIMITS_TIMEOUT_S");
    OverridePositive(config.limits.request_timeout_s,
                     "VIZRUN_LIMITS__REQUEST_TIMEOUT_S",
                     "VIZRUN_LIMITS_REQUEST_TIMEOUT_S");
    OverridePositive(config.limits.memory_mb, "VIZRUN_LIMITS__MEMORY_MB", "VIZRUN_LIMITS_MEMORY_MB");
    OverridePositive(config.limits.max_workers, "VIZRUN_LIMITS__MAX_WORKERS", "VIZRUN_LIMITS_MAX_WORKERS");
    OverrideString(config.limits.admission_policy,
                   "VIZRUN_LIMITS__ADMISSION_POLICY",
                   "VIZRUN_LIMITS_ADMISSION_POLICY");
    OverridePositive(config.limits.max_artifact_bytes,
                     "VIZRUN_LIMITS__MAX_ARTIFACT_BYTES",
                     "VIZRUN_LIMITS_MAX_ARTIFACT_BYTES");
    OverridePositive(config.limits.max_code_length,
                     "VIZRUN_LIMITS__MAX_CODE_LENGTH",
                     "VIZRUN_LIMITS_MAX_CODE_LENGTH");
    OverridePositive(config.limits.max_diagnostic_bytes,
                     "VIZRUN_LIMITS__MAX_DIAGNOSTIC_BYTES",
                     "VIZRUN_LIMITS_MAX_DIAGNOSTIC_BYTES");

    OverrideString(config.sandbox.scratch_root, "VIZRUN_SANDBOX__SCRATCH_ROOT", "VIZRUN_SANDBOX_SCRATCH_ROOT");
    OverrideBool(config.sandbox.isolate, "VIZRUN_SANDBOX__ISOLATE", "VIZRUN_SANDBOX_ISOLATE");
    OverrideString(config.sandbox.search_path, "VIZRUN_SANDBOX__SEARCH_PATH", "VIZRUN_SANDBOX_SEARCH_PATH");
    OverrideList(config.sandbox.pass_env, "VIZRUN_SANDBOX__PASS_ENV", "VIZRUN_SANDBOX_PASS_ENV");
    OverrideList(config.sandbox.read_only_paths,
                 "VIZRUN_SANDBOX__READ_ONLY_PATHS",
                 "VIZRUN_SANDBOX_READ_ONLY_PATHS");
    OverridePositive(config.sandbox.max_file_mb, "VIZRUN_SANDBOX__MAX_FILE_MB", "VIZRUN_SANDBOX_MAX_FILE_MB");
    OverridePositive(config.sandbox.max_open_files,
                     "VIZRUN_SANDBOX__MAX_OPEN_FILES",
                     "VIZRUN_SANDBOX_MAX_OPEN_FILES");
    OverridePositive(config.sandbox.max_processes,
                     "VIZRUN_SANDBOX__MAX_PROCESSES",
                     "VIZRUN_SANDBOX_MAX_PROCESSES");
    OverridePositive(config.sandbox.poll_interval_ms,
                     "VIZRUN_SANDBOX__POLL_INTERVAL_MS",
                     "VIZRUN_SANDBOX_POLL_INTERVAL_MS");
    OverridePositive(config.sandbox.kill_grace_ms,
                     "VIZRUN_SANDBOX__KILL_GRACE_MS",
                     "VIZRUN_SANDBOX_KILL_GRACE_MS");

    OverrideBool(config.runtimes.python.enabled,
                 "VIZRUN_RUNTIMES__PYTHON__ENABLED",
                 "VIZRUN_RUNTIMES_PYTHON_ENABLED");
    OverrideString(config.runtimes.python.command,
                   "VIZRUN_RUNTIMES__PYTHON__COMMAND",
                   "VIZRUN_RUNTIMES_PYTHON_COMMAND");
    OverrideBool(config.runtimes.r.enabled, "VIZRUN_RUNTIMES__R__ENABLED", "VIZRUN_RUNTIMES_R_ENABLED");
    OverrideString(config.runtimes.r.command, "VIZRUN_RUNTIMES__R__COMMAND", "VIZRUN_RUNTIMES_R_COMMAND");

    OverrideString(config.logging.level, "VIZRUN_LOGGING__LEVEL", "VIZRUN_LOGGING_LEVEL");
}

void Sanitize(Config& config) {
    const auto policy = utils::ToLower(config.limits.admission_policy);
    if (policy != "reject" && policy != "queue") {
        utils::LogWarn("config", "unknown admission policy, using reject",
                       {{"policy", config.limits.admission_policy}});
        config.limits.admission_policy = "reject";
    } else {
        config.limits.admission_policy = policy;
    }
    if (config.limits.request_timeout_s < config.limits.timeout_s) {
        utils::LogWarn("config", "request timeout shorter than worker timeout",
                       {{"request_timeout_s", std::to_string(config.limits.request_timeout_s)},
                        {"timeout_s", std::to_string(config.limits.timeout_s)}});
    }
    if (config.sandbox.scratch_root.empty()) {
        config.sandbox.scratch_root = DefaultScratchRoot().string();
    }
    if (!utils::ParseLogLevel(config.logging.level)) {
        utils::LogWarn("config", "unknown log level, using info", {{"level", config.logging.level}});
        config.logging.level = "info";
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto explicit_path = GetEnv("VIZRUN_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".vizrun" / "config.json";
}

std::filesystem::path DefaultScratchRoot() {
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = "/tmp";
    }
    return temp / "vizrun";
}

Config LoadConfigFrom(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            utils::LogWarn("config", "cannot open config file", {{"path", config_path.string()}});
        } else {
            try {
                nlohmann::json data;
                input >> data;
                ApplyConfigFromJson(config, data);
            } catch (const nlohmann::json::exception& ex) {
                // Keep defaults on parse errors
                utils::LogWarn("config", "config file is not valid JSON",
                               {{"path", config_path.string()}, {"error", ex.what()}});
            }
        }
    }

    ApplyConfigFromEnv(config);
    Sanitize(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(DefaultConfigPath());
}

}  // namespace vizrun::config
