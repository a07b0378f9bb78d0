#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

#include <signal.h>

#include <gtest/gtest.h>

#include "adapters/python_adapter.hpp"
#include "governor/resource_governor.hpp"
#include "output/output_normalizer.hpp"
#include "sandbox/process_tree.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "test_support.hpp"

namespace vizrun::sandbox {
namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::steady_clock;

class SandboxExecutorTest : public ::testing::Test {
protected:
    SandboxLimits MakeLimits() const {
        SandboxLimits limits;
        limits.scratch_root = scratch_.Path();
        limits.isolate = false;
        limits.search_path = "/usr/bin:/bin";
        limits.pass_env = {};
        // Counted per user outside a user namespace.
        limits.max_processes = 4096;
        limits.poll_interval = milliseconds(10);
        limits.kill_grace = milliseconds(200);
        return limits;
    }

    governor::GovernorLimits MakeGovernorLimits(seconds timeout) const {
        governor::GovernorLimits limits;
        limits.max_workers = 2;
        limits.ceilings.timeout = timeout;
        return limits;
    }

    governor::GovernorLimits MakeGovernorLimits(seconds timeout, std::size_t memory_mb) const {
        auto limits = MakeGovernorLimits(timeout);
        limits.ceilings.memory_bytes = memory_mb * 1024 * 1024;
        return limits;
    }

    WorkerReport RunShell(const SandboxExecutor& executor,
                          governor::ResourceGovernor& governor,
                          const std::string& code,
                          steady_clock::time_point deadline = steady_clock::now() + seconds(30)) {
        vizrun::testing::ShellAdapter adapter;
        const auto unit = adapter.BuildAdaptedUnit(code, execution::VizType::kStatic);
        auto admission = governor.Admit(deadline);
        EXPECT_EQ(admission.status, governor::AdmissionStatus::kAdmitted);
        return executor.Run(unit, *admission.handle, deadline);
    }

    // Pid written by a worker into path, or -1.
    static pid_t ReadPid(const std::filesystem::path& path) {
        std::ifstream input(path);
        pid_t pid = -1;
        input >> pid;
        return pid;
    }

    bool ScratchRootIsEmpty() const {
        return std::filesystem::is_empty(scratch_.Path());
    }

    vizrun::testing::TempDir scratch_;
};

TEST_F(SandboxExecutorTest, CompletedRunReturnsArtifact) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor,
                                 "echo working; printf 'PNGDATA' > \"$VIZRUN_ARTIFACT_PATH\"");

    EXPECT_EQ(report.outcome, WorkerOutcome::kCompleted);
    EXPECT_EQ(report.exit_code, 0);
    ASSERT_TRUE(report.artifact.has_value());
    EXPECT_EQ(*report.artifact, "PNGDATA");
    EXPECT_EQ(report.stdout_text, "working\n");
    EXPECT_GT(report.pid, 0);
    EXPECT_EQ(governor.LiveWorkers(), 0u);
    EXPECT_EQ(governor.Stats().completed, 1u);
}

TEST_F(SandboxExecutorTest, ScratchDirectoryIsRemovedAfterRun) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor,
                                 "touch leftover; mkdir -p deep/tree; pwd > \"$VIZRUN_ARTIFACT_PATH\"");

    ASSERT_TRUE(report.artifact.has_value());
    const std::filesystem::path work_dir(vizrun::utils::Trim(*report.artifact));
    EXPECT_EQ(work_dir.filename(), "work");
    EXPECT_FALSE(std::filesystem::exists(work_dir));
    EXPECT_TRUE(ScratchRootIsEmpty());
}

TEST_F(SandboxExecutorTest, EnvironmentIsScrubbed) {
    vizrun::testing::ScopedEnv secret("VIZRUN_TEST_SECRET", std::string("hunter2"));
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor, "env > \"$VIZRUN_ARTIFACT_PATH\"");

    ASSERT_TRUE(report.artifact.has_value());
    EXPECT_EQ(report.artifact->find("hunter2"), std::string::npos);
    EXPECT_NE(report.artifact->find("PATH=/usr/bin:/bin"), std::string::npos);
    EXPECT_NE(report.artifact->find("OMP_NUM_THREADS=1"), std::string::npos);
}

TEST_F(SandboxExecutorTest, PassEnvForwardsListedVariables) {
    vizrun::testing::ScopedEnv forwarded("VIZRUN_TEST_FORWARDED", std::string("visible"));
    auto limits = MakeLimits();
    limits.pass_env = {"VIZRUN_TEST_FORWARDED"};
    SandboxExecutor executor(limits);
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor,
                                 "printf '%s' \"$VIZRUN_TEST_FORWARDED\" > \"$VIZRUN_ARTIFACT_PATH\"");

    ASSERT_TRUE(report.artifact.has_value());
    EXPECT_EQ(*report.artifact, "visible");
}

TEST_F(SandboxExecutorTest, TimeoutKillsWholeProcessGroup) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(1)));

    const auto started = steady_clock::now();
    const auto report = RunShell(executor, governor, "sleep 30 & sleep 30");
    const auto elapsed = steady_clock::now() - started;

    EXPECT_EQ(report.outcome, WorkerOutcome::kTimedOut);
    EXPECT_EQ(report.kill_reason, KillReason::kTimeout);
    EXPECT_FALSE(report.artifact.has_value());
    EXPECT_LT(elapsed, seconds(5));
    const int leader = ::kill(report.pid, 0);
    const int leader_errno = errno;
    EXPECT_EQ(leader, -1);
    EXPECT_EQ(leader_errno, ESRCH);
    EXPECT_EQ(::kill(-report.pid, 0), -1);
    EXPECT_EQ(governor.Stats().timed_out, 1u);
    EXPECT_TRUE(ScratchRootIsEmpty());
}

TEST_F(SandboxExecutorTest, RequestDeadlineBeforeTimeoutIsReported) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(30)));

    const auto report = RunShell(executor, governor, "sleep 30",
                                 steady_clock::now() + milliseconds(300));

    EXPECT_EQ(report.outcome, WorkerOutcome::kTimedOut);
    EXPECT_EQ(report.kill_reason, KillReason::kDeadline);
}

TEST_F(SandboxExecutorTest, CancellationKillsWorker) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(30)));

    std::thread canceller([&governor] {
        std::this_thread::sleep_for(milliseconds(200));
        governor.Shutdown();
    });
    const auto report = RunShell(executor, governor, "printf x > \"$VIZRUN_ARTIFACT_PATH\"; sleep 30");
    canceller.join();

    EXPECT_EQ(report.outcome, WorkerOutcome::kKilled);
    EXPECT_EQ(report.kill_reason, KillReason::kCancelled);
    EXPECT_FALSE(report.artifact.has_value());
    EXPECT_EQ(governor.LiveWorkers(), 0u);
}

TEST_F(SandboxExecutorTest, NonZeroExitKeepsDiagnostics) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor, "echo 'boom' >&2; exit 3");

    EXPECT_EQ(report.outcome, WorkerOutcome::kCompleted);
    EXPECT_EQ(report.exit_code, 3);
    EXPECT_EQ(report.stderr_text, "boom\n");
    EXPECT_FALSE(report.stderr_truncated);
}

TEST_F(SandboxExecutorTest, FatalSignalIsACrash) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor, "kill -SEGV $$");

    EXPECT_EQ(report.outcome, WorkerOutcome::kCrashed);
    EXPECT_EQ(report.term_signal, SIGSEGV);
    EXPECT_EQ(governor.Stats().crashed, 1u);
}

TEST_F(SandboxExecutorTest, OversizedArtifactIsNotRead) {
    auto limits = MakeLimits();
    limits.max_artifact_bytes = 10;
    SandboxExecutor executor(limits);
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor,
                                 "printf '%0100d' 0 > \"$VIZRUN_ARTIFACT_PATH\"");

    EXPECT_EQ(report.outcome, WorkerOutcome::kCompleted);
    EXPECT_TRUE(report.artifact_oversized);
    EXPECT_EQ(report.artifact_size, 100u);
    EXPECT_FALSE(report.artifact.has_value());
}

TEST_F(SandboxExecutorTest, SymlinkedArtifactIsIgnored) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor, "ln -s /etc/hostname \"$VIZRUN_ARTIFACT_PATH\"");

    EXPECT_EQ(report.outcome, WorkerOutcome::kCompleted);
    EXPECT_FALSE(report.artifact.has_value());
}

TEST_F(SandboxExecutorTest, CaptureKeepsTheTail) {
    auto limits = MakeLimits();
    limits.max_capture_bytes = 8;
    SandboxExecutor executor(limits);
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor, "printf 'aaaaaaaaaaaaaaaaLASTLINE' >&2; exit 1");

    EXPECT_TRUE(report.stderr_truncated);
    EXPECT_EQ(report.stderr_text, "LASTLINE");
}

TEST_F(SandboxExecutorTest, StandardInputIsEmpty) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(5)));

    const auto report = RunShell(executor, governor, "cat > \"$VIZRUN_ARTIFACT_PATH\"");

    EXPECT_EQ(report.outcome, WorkerOutcome::kCompleted);
    ASSERT_TRUE(report.artifact.has_value());
    EXPECT_TRUE(report.artifact->empty());
}

TEST_F(SandboxExecutorTest, MissingInterpreterIsASandboxError) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(5)));
    adapters::AdaptedUnit unit;
    unit.command = {"vizrun-no-such-interpreter"};
    unit.script_name = "main.txt";
    unit.source = "x";
    auto admission = governor.Admit(steady_clock::now() + seconds(5));
    ASSERT_EQ(admission.status, governor::AdmissionStatus::kAdmitted);

    const auto report = executor.Run(unit, *admission.handle, steady_clock::now() + seconds(5));

    EXPECT_EQ(report.outcome, WorkerOutcome::kSandboxError);
    EXPECT_NE(report.internal_error.find("vizrun-no-such-interpreter"), std::string::npos);
    EXPECT_EQ(governor.LiveWorkers(), 0u);
}

TEST_F(SandboxExecutorTest, DetachedSessionIsKilledOnTimeout) {
    vizrun::testing::TempDir marker;
    const auto pid_file = (marker.Path() / "leak.pid").string();
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(1)));

    const auto report = RunShell(executor, governor,
                                 "setsid sh -c 'echo $$ > " + pid_file + "; exec sleep 60' &\n"
                                 "while [ ! -s " + pid_file + " ]; do sleep 0.05; done\n"
                                 "sleep 30");

    EXPECT_EQ(report.outcome, WorkerOutcome::kTimedOut);
    const pid_t leaked = ReadPid(pid_file);
    ASSERT_GT(leaked, 0);
    EXPECT_FALSE(IsProcessAlive(leaked));
    EXPECT_TRUE(ScratchRootIsEmpty());
}

TEST_F(SandboxExecutorTest, DetachedSessionDoesNotOutliveCompletedWorker) {
    vizrun::testing::TempDir marker;
    const auto pid_file = (marker.Path() / "leak.pid").string();
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor,
                                 "setsid sh -c 'echo $$ > " + pid_file + "; exec sleep 60' &\n"
                                 "while [ ! -s " + pid_file + " ]; do sleep 0.05; done\n"
                                 "printf ok > \"$VIZRUN_ARTIFACT_PATH\"");

    EXPECT_EQ(report.outcome, WorkerOutcome::kCompleted);
    ASSERT_TRUE(report.artifact.has_value());
    EXPECT_EQ(*report.artifact, "ok");
    const pid_t leaked = ReadPid(pid_file);
    ASSERT_GT(leaked, 0);
    EXPECT_FALSE(IsProcessAlive(leaked));
}

TEST_F(SandboxExecutorTest, MemoryCeilingCoversAllChildrenTogether) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(20), 40));

    // Each subshell stays well below the ceiling; together they pass it.
    const auto report = RunShell(executor, governor,
                                 "for i in 1 2 3 4 5 6; do\n"
                                 "  ( x=$(yes | head -c 8000000); sleep 10 ) &\n"
                                 "done\n"
                                 "wait");

    EXPECT_EQ(report.outcome, WorkerOutcome::kKilled);
    EXPECT_EQ(report.kill_reason, KillReason::kMemory);
    EXPECT_GT(report.peak_rss_bytes, 40u * 1024 * 1024);
    EXPECT_EQ(governor.Stats().killed, 1u);
    EXPECT_TRUE(ScratchRootIsEmpty());
}

TEST_F(SandboxExecutorTest, WorkerOverMemoryCeilingIsResourceExceeded) {
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(20), 48));
    output::NormalizerLimits normalizer_limits;
    normalizer_limits.memory_mb = 48;
    output::OutputNormalizer normalizer(normalizer_limits);
    vizrun::testing::ShellAdapter adapter;
    const auto unit = adapter.BuildAdaptedUnit("x=$(yes | head -c 100000000)\n"
                                               "printf ok > \"$VIZRUN_ARTIFACT_PATH\"",
                                               execution::VizType::kStatic);
    const auto deadline = steady_clock::now() + seconds(30);
    auto admission = governor.Admit(deadline);
    ASSERT_EQ(admission.status, governor::AdmissionStatus::kAdmitted);

    const auto report = executor.Run(unit, *admission.handle, deadline);
    const auto result = normalizer.Normalize(unit, report);

    EXPECT_FALSE(report.artifact.has_value());
    ASSERT_TRUE(result.IsFailure()) << result.Describe();
    EXPECT_EQ(result.GetFailure().kind, execution::FailureKind::kResourceExceeded)
        << ToString(report.outcome) << " " << report.stderr_text;
    EXPECT_EQ(result.GetFailure().message, "Execution exceeded the memory limit of 48 MB");
}

TEST_F(SandboxExecutorTest, ProcessLimitsAreApplied) {
    auto limits = MakeLimits();
    limits.max_processes = 64;
    SandboxExecutor executor(limits);
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(5)));

    const auto report = RunShell(executor, governor, "ulimit -t; ulimit -H -t; ulimit -u");

    EXPECT_EQ(report.outcome, WorkerOutcome::kCompleted);
    // SIGXCPU one second after the timeout, SIGKILL one second after that.
    EXPECT_EQ(report.stdout_text, "6\n7\n64\n");
    EXPECT_FALSE(report.cpu_limit_reached);
}

TEST_F(SandboxExecutorTest, IsolatedRunProducesArtifactOrFailsClosed) {
    auto limits = MakeLimits();
    limits.isolate = true;
    SandboxExecutor executor(limits);
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    const auto report = RunShell(executor, governor,
                                 "echo $$; pwd; printf ok > \"$VIZRUN_ARTIFACT_PATH\"");

    if (report.outcome == WorkerOutcome::kSandboxError) {
        // Unprivileged namespaces are disabled here; the run must not have
        // proceeded without isolation.
        EXPECT_FALSE(report.artifact.has_value());
        GTEST_SKIP() << report.internal_error;
    }
    EXPECT_EQ(report.outcome, WorkerOutcome::kCompleted);
    ASSERT_TRUE(report.artifact.has_value());
    EXPECT_EQ(*report.artifact, "ok");
    // First process of a private pid namespace, inside the scratch mount.
    EXPECT_EQ(report.stdout_text, "1\n/sandbox/work\n");
    EXPECT_TRUE(ScratchRootIsEmpty());
}

TEST_F(SandboxExecutorTest, IsolatedWorkerCanOnlyWriteItsScratchDirectory) {
    vizrun::testing::TempDir host;
    const auto secret = host.Path() / "secret.txt";
    std::ofstream(secret) << "hunter2";
    const auto escape = host.Path() / "escape.txt";
    // Scratch directory of another worker running at the same time.
    const auto victim = scratch_.Path() / "run-victim" / "artifact.png";
    std::filesystem::create_directories(victim.parent_path());
    std::ofstream(victim) << "REAL";

    auto limits = MakeLimits();
    limits.isolate = true;
    SandboxExecutor executor(limits);
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(10)));

    std::ostringstream code;
    code << "for target in '" << escape.string() << "' '" << victim.string() << "' "
         << "/usr/vizrun-escape /etc/vizrun-escape /vizrun-escape; do\n"
         << "  if (echo pwned > \"$target\") 2>/dev/null; then echo \"wrote $target\"; fi\n"
         << "done\n"
         << "cat '" << secret.string() << "' 2>/dev/null\n"
         << "echo scratch > note.txt && cat note.txt\n"
         << "printf ok > \"$VIZRUN_ARTIFACT_PATH\"";
    const auto report = RunShell(executor, governor, code.str());

    if (report.outcome == WorkerOutcome::kSandboxError) {
        GTEST_SKIP() << report.internal_error;
    }
    EXPECT_EQ(report.outcome, WorkerOutcome::kCompleted);
    EXPECT_EQ(report.stdout_text, "scratch\n");
    EXPECT_EQ(report.stdout_text.find("hunter2"), std::string::npos);
    ASSERT_TRUE(report.artifact.has_value());
    EXPECT_EQ(*report.artifact, "ok");

    EXPECT_FALSE(std::filesystem::exists(escape));
    EXPECT_FALSE(std::filesystem::exists("/usr/vizrun-escape"));
    EXPECT_FALSE(std::filesystem::exists("/etc/vizrun-escape"));
    std::ifstream victim_input(victim);
    std::string victim_content;
    victim_input >> victim_content;
    EXPECT_EQ(victim_content, "REAL");
}

TEST_F(SandboxExecutorTest, PythonExportsNewestBoundPlotlyFigure) {
    if (std::system("env -i PATH=/usr/bin:/bin HOME=/nonexistent "
                    "python3 -c 'import matplotlib, numpy, plotly' >/dev/null 2>&1") != 0) {
        GTEST_SKIP() << "python3 with matplotlib, numpy and plotly is not installed";
    }
    SandboxExecutor executor(MakeLimits());
    governor::ResourceGovernor governor(MakeGovernorLimits(seconds(30)));
    adapters::PythonAdapter adapter("python3");
    // Rebinding `first` keeps its original place in the module namespace.
    const auto unit = adapter.BuildAdaptedUnit(
        "first = go.Figure(layout_title_text='stale-title')\n"
        "second = go.Figure(layout_title_text='middle-title')\n"
        "first = go.Figure(layout_title_text='newest-title')\n",
        execution::VizType::kInteractive);
    const auto deadline = steady_clock::now() + seconds(30);
    auto admission = governor.Admit(deadline);
    ASSERT_EQ(admission.status, governor::AdmissionStatus::kAdmitted);

    const auto report = executor.Run(unit, *admission.handle, deadline);

    ASSERT_EQ(report.outcome, WorkerOutcome::kCompleted) << report.stderr_text;
    ASSERT_TRUE(report.artifact.has_value()) << report.stderr_text;
    EXPECT_NE(report.artifact->find("newest-title"), std::string::npos);
    EXPECT_EQ(report.artifact->find("middle-title"), std::string::npos);
}

}  // namespace
}  // namespace vizrun::sandbox
