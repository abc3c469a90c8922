#include <gtest/gtest.h>

#include <string>

#include <signal.h>

#include "sandbox/sandbox_executor.hpp"
#include "test_support.hpp"

namespace coderun::sandbox {
namespace {

ExecRequest Shell(const std::string& script) {
    ExecRequest request;
    request.argv = {"/bin/sh", "-c", script};
    request.timeout = std::chrono::milliseconds(5000);
    return request;
}

TEST(SandboxExecutorTest, CapturesStdoutAndExitCode) {
    const auto result = SandboxExecutor::Run(Shell("printf hello"));
    EXPECT_FALSE(result.launch_failed);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello");
    EXPECT_EQ(result.error, "");
    EXPECT_GT(result.elapsed.count(), 0.0);
}

TEST(SandboxExecutorTest, CapturesStderrSeparately) {
    const auto result = SandboxExecutor::Run(Shell("echo out; echo err 1>&2; exit 3"));
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
}

TEST(SandboxExecutorTest, FeedsStdinPayload) {
    ExecRequest request;
    request.argv = {"cat"};
    request.stdin_data = "line one\nline two\n";
    const auto result = SandboxExecutor::Run(request);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "line one\nline two\n");
}

TEST(SandboxExecutorTest, AbsentStdinReadsAsEndOfFile) {
    ExecRequest request;
    request.argv = {"cat"};
    request.timeout = std::chrono::milliseconds(5000);
    const auto result = SandboxExecutor::Run(request);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "");
}

TEST(SandboxExecutorTest, RunsInWorkingDirectory) {
    test::ScopedTempDir dir;
    auto request = Shell("pwd -P");
    request.working_dir = dir.Path().string();
    const auto result = SandboxExecutor::Run(request);
    EXPECT_EQ(result.output, dir.Path().string() + "\n");
}

TEST(SandboxExecutorTest, KillsAndReapsOnTimeout) {
    test::ScopedTempDir dir;
    const auto pid_file = dir.Path() / "child.pid";
    auto request = Shell("echo $$ > '" + pid_file.string() + "'; exec sleep 30");
    request.timeout = std::chrono::milliseconds(500);

    const auto result = SandboxExecutor::Run(request);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_GE(result.elapsed.count(), 500.0);
    EXPECT_LT(result.elapsed.count(), 3000.0);

    const auto pid = static_cast<pid_t>(std::stol(test::ReadFile(pid_file)));
    EXPECT_FALSE(test::ProcessAlive(pid));
}

TEST(SandboxExecutorTest, TimeoutKillsWholeProcessTree) {
    test::ScopedTempDir dir;
    const auto pid_file = dir.Path() / "grandchild.pid";
    auto request = Shell("sleep 30 & echo $! > '" + pid_file.string() + "'; sleep 30");
    request.timeout = std::chrono::milliseconds(500);

    const auto result = SandboxExecutor::Run(request);
    EXPECT_TRUE(result.timed_out);

    const auto pid = static_cast<pid_t>(std::stol(test::ReadFile(pid_file)));
    EXPECT_FALSE(test::ProcessAlive(pid));
}

TEST(SandboxExecutorTest, NormalExitLeavesNoBackgroundChildren) {
    test::ScopedTempDir dir;
    const auto pid_file = dir.Path() / "background.pid";
    const auto result = SandboxExecutor::Run(
        Shell("sleep 30 > /dev/null 2>&1 & echo $! > '" + pid_file.string() + "'"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_LT(result.elapsed.count(), 5000.0);

    const auto pid = static_cast<pid_t>(std::stol(test::ReadFile(pid_file)));
    EXPECT_FALSE(test::ProcessAlive(pid));
}

// With SIGCHLD ignored the kernel reaps children itself, so waiting fails.
TEST(SandboxExecutorTest, WaitFailureIsNotReportedAsTimeout) {
    struct IgnoreSigchld {
        IgnoreSigchld() { previous = ::signal(SIGCHLD, SIG_IGN); }
        ~IgnoreSigchld() { ::signal(SIGCHLD, previous); }
        void (*previous)(int);
    } ignore;

    auto request = Shell("exit 0");
    request.timeout = std::chrono::milliseconds(5000);
    const auto result = SandboxExecutor::Run(request);
    EXPECT_TRUE(result.launch_failed);
    EXPECT_FALSE(result.not_found);
    EXPECT_FALSE(result.timed_out);
    EXPECT_NE(result.error.find("wait failed"), std::string::npos);
    EXPECT_LT(result.elapsed.count(), 5000.0);
}

TEST(SandboxExecutorTest, ReportsMissingExecutable) {
    ExecRequest request;
    request.argv = {"coderun-definitely-not-installed"};
    const auto result = SandboxExecutor::Run(request);
    EXPECT_TRUE(result.launch_failed);
    EXPECT_TRUE(result.not_found);
    EXPECT_NE(result.error.find("coderun-definitely-not-installed"), std::string::npos);
}

TEST(SandboxExecutorTest, RejectsEmptyCommand) {
    const auto result = SandboxExecutor::Run(ExecRequest{});
    EXPECT_TRUE(result.launch_failed);
    EXPECT_FALSE(result.not_found);
}

TEST(SandboxExecutorTest, SignalledChildMapsToShellConvention) {
    const auto result = SandboxExecutor::Run(Shell("kill -9 $$"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST(SandboxExecutorTest, ResolvesExecutablesOnPath) {
    EXPECT_FALSE(SandboxExecutor::ResolveExecutable("sh").empty());
    EXPECT_EQ(SandboxExecutor::ResolveExecutable("/bin/sh"), "/bin/sh");
    EXPECT_TRUE(SandboxExecutor::ResolveExecutable("coderun-definitely-not-installed").empty());
    EXPECT_TRUE(SandboxExecutor::ResolveExecutable("/nonexistent/dir/tool").empty());
}

}  // namespace
}  // namespace coderun::sandbox
