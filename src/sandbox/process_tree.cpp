#include "sandbox/process_tree.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

#include <unistd.h>

namespace vizrun::sandbox {
namespace {

std::size_t PageSize() {
    static const long page_size = ::sysconf(_SC_PAGESIZE);
    return static_cast<std::size_t>(page_size > 0 ? page_size : 4096);
}

bool IsNumeric(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

// /proc/<pid>/stat: "pid (comm) state ppid ... rss ...". comm may hold spaces
// and parentheses, so fields are counted from the last ')'.
std::optional<ProcessInfo> ReadStat(pid_t pid) {
    std::ifstream input("/proc/" + std::to_string(pid) + "/stat");
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::string line((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    const auto comm_end = line.rfind(')');
    if (comm_end == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream fields(line.substr(comm_end + 1));
    ProcessInfo info;
    info.pid = pid;
    std::string skip;
    if (!(fields >> info.state >> info.ppid)) {
        return std::nullopt;
    }
    // pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt utime stime
    // cutime cstime priority nice num_threads itrealvalue starttime vsize
    for (int i = 0; i < 19; ++i) {
        if (!(fields >> skip)) {
            return info;
        }
    }
    long long rss_pages = 0;
    if (fields >> rss_pages && rss_pages > 0) {
        info.resident_bytes = static_cast<std::size_t>(rss_pages) * PageSize();
    }
    return info;
}

}  // namespace

std::vector<ProcessInfo> ListProcesses() {
    std::vector<ProcessInfo> processes;
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc", ec);
    const std::filesystem::directory_iterator end;
    while (!ec && it != end) {
        const auto name = it->path().filename().string();
        if (IsNumeric(name)) {
            const auto pid = static_cast<pid_t>(std::strtol(name.c_str(), nullptr, 10));
            if (auto info = ReadStat(pid)) {
                processes.push_back(*info);
            }
        }
        it.increment(ec);
    }
    return processes;
}

std::vector<ProcessInfo> ProcessTree(pid_t root, const std::vector<ProcessInfo>& snapshot) {
    std::unordered_multimap<pid_t, const ProcessInfo*> children;
    const ProcessInfo* root_info = nullptr;
    for (const auto& info : snapshot) {
        children.emplace(info.ppid, &info);
        if (info.pid == root) {
            root_info = &info;
        }
    }
    std::vector<ProcessInfo> tree;
    if (root_info == nullptr) {
        return tree;
    }
    tree.push_back(*root_info);
    for (std::size_t i = 0; i < tree.size(); ++i) {
        const auto range = children.equal_range(tree[i].pid);
        for (auto child = range.first; child != range.second; ++child) {
            tree.push_back(*child->second);
        }
    }
    return tree;
}

std::vector<ProcessInfo> ProcessTree(pid_t root) {
    return ProcessTree(root, ListProcesses());
}

std::size_t TreeResidentBytes(const std::vector<ProcessInfo>& tree) {
    std::size_t total = 0;
    for (const auto& info : tree) {
        total += info.resident_bytes;
    }
    return total;
}

bool IsProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    const auto info = ReadStat(pid);
    return info.has_value() && info->state != 'Z' && info->state != 'X';
}

}  // namespace vizrun::sandbox
