#include <algorithm>
#include <chrono>
#include <thread>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "sandbox/process_tree.hpp"

namespace vizrun::sandbox {
namespace {

ProcessInfo Process(pid_t pid, pid_t ppid, std::size_t resident = 0) {
    ProcessInfo info;
    info.pid = pid;
    info.ppid = ppid;
    info.state = 'S';
    info.resident_bytes = resident;
    return info;
}

bool Contains(const std::vector<ProcessInfo>& tree, pid_t pid) {
    return std::any_of(tree.begin(), tree.end(), [pid](const ProcessInfo& info) { return info.pid == pid; });
}

TEST(ProcessTreeTest, CollectsDescendantsRootFirst) {
    const std::vector<ProcessInfo> snapshot = {
        Process(1, 0, 100),
        Process(12, 11, 3000),
        Process(10, 1, 1000),
        Process(20, 1, 9999),
        Process(11, 10, 2000),
    };

    const auto tree = ProcessTree(10, snapshot);

    ASSERT_EQ(tree.size(), 3u);
    EXPECT_EQ(tree.front().pid, 10);
    EXPECT_TRUE(Contains(tree, 11));
    EXPECT_TRUE(Contains(tree, 12));
    EXPECT_FALSE(Contains(tree, 20));
    EXPECT_EQ(TreeResidentBytes(tree), 6000u);
}

TEST(ProcessTreeTest, MissingRootIsAnEmptyTree) {
    const std::vector<ProcessInfo> snapshot = {Process(1, 0), Process(11, 10)};
    EXPECT_TRUE(ProcessTree(10, snapshot).empty());
    EXPECT_EQ(TreeResidentBytes({}), 0u);
}

TEST(ProcessTreeTest, SeesLiveGrandchildren) {
    int ready[2];
    ASSERT_EQ(::pipe(ready), 0);
    const pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::close(ready[0]);
        const pid_t grandchild = ::fork();
        if (grandchild == 0) {
            ::pause();
            ::_exit(0);
        }
        (void)!::write(ready[1], &grandchild, sizeof(grandchild));
        ::pause();
        ::_exit(0);
    }
    ::close(ready[1]);
    pid_t grandchild = -1;
    ASSERT_EQ(::read(ready[0], &grandchild, sizeof(grandchild)), static_cast<ssize_t>(sizeof(grandchild)));
    ::close(ready[0]);

    const auto tree = ProcessTree(child);
    EXPECT_EQ(tree.front().pid, child);
    EXPECT_TRUE(Contains(tree, grandchild));
    EXPECT_GT(TreeResidentBytes(tree), 0u);
    EXPECT_TRUE(Contains(ProcessTree(::getpid()), grandchild));

    ::kill(grandchild, SIGKILL);
    ::kill(child, SIGKILL);
    ::waitpid(child, nullptr, 0);
}

TEST(ProcessTreeTest, ZombiesAreNotAlive) {
    EXPECT_TRUE(IsProcessAlive(::getpid()));
    EXPECT_FALSE(IsProcessAlive(-1));

    const pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::_exit(0);
    }
    const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (IsProcessAlive(child) && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_FALSE(IsProcessAlive(child));
    ::waitpid(child, nullptr, 0);
    EXPECT_FALSE(IsProcessAlive(child));
}

}  // namespace
}  // namespace vizrun::sandbox
