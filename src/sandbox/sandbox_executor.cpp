#include "sandbox/sandbox_executor.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::sandbox {
namespace bp = boost::process;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(5);

std::string CaptureStamp() {
    static std::atomic<int> counter{0};
    return std::to_string(::getpid()) + "_" +
           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
           std::to_string(++counter);
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream target;
    target << input.rdbuf();
    return target.str();
}

// Temporary capture files for one child, removed on scope exit.
class CaptureFiles {
public:
    CaptureFiles() {
        const auto stamp = CaptureStamp();
        const auto dir = std::filesystem::temp_directory_path();
        stdin_path_ = dir / ("coderun_stdin_" + stamp + ".txt");
        stdout_path_ = dir / ("coderun_stdout_" + stamp + ".log");
        stderr_path_ = dir / ("coderun_stderr_" + stamp + ".log");
    }

    ~CaptureFiles() {
        std::error_code ec;
        std::filesystem::remove(stdin_path_, ec);
        std::filesystem::remove(stdout_path_, ec);
        std::filesystem::remove(stderr_path_, ec);
    }

    CaptureFiles(const CaptureFiles&) = delete;
    CaptureFiles& operator=(const CaptureFiles&) = delete;

    bool WriteStdin(const std::string& data) const {
        std::ofstream output(stdin_path_, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            return false;
        }
        output << data;
        return static_cast<bool>(output);
    }

    const std::filesystem::path& StdinPath() const { return stdin_path_; }
    const std::filesystem::path& StdoutPath() const { return stdout_path_; }
    const std::filesystem::path& StderrPath() const { return stderr_path_; }

private:
    std::filesystem::path stdin_path_;
    std::filesystem::path stdout_path_;
    std::filesystem::path stderr_path_;
};

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

enum class WaitOutcome {
    kExited,
    kDeadline,
    kFailed
};

// Polls for exit without reaping (WNOWAIT), leaving the pid and its process
// group reserved until the caller has killed the group.
WaitOutcome WaitForExit(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    while (std::chrono::steady_clock::now() < deadline) {
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
            if (errno == EINTR) {
                continue;
            }
            return WaitOutcome::kFailed;
        }
        if (info.si_pid == pid) {
            return WaitOutcome::kExited;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    return WaitOutcome::kDeadline;
}

}  // namespace

std::string SandboxExecutor::ResolveExecutable(const std::string& name) {
    if (name.empty()) {
        return {};
    }
    if (name.find('/') != std::string::npos) {
        std::error_code ec;
        return std::filesystem::exists(name, ec) ? name : std::string();
    }
    const auto found = bp::search_path(name);
    return found.empty() ? std::string() : found.string();
}

ExecResult SandboxExecutor::Run(const ExecRequest& request) {
    ExecResult result{};
    if (request.argv.empty()) {
        result.launch_failed = true;
        result.error = "Error: empty command";
        return result;
    }

    const auto executable = ResolveExecutable(request.argv.front());
    if (executable.empty()) {
        result.launch_failed = true;
        result.not_found = true;
        result.error = "Error: command not found: " + request.argv.front();
        return result;
    }
    const std::vector<std::string> args(request.argv.begin() + 1, request.argv.end());

    CaptureFiles capture;
    std::string stdin_path = "/dev/null";
    if (request.stdin_data) {
        if (!capture.WriteStdin(*request.stdin_data)) {
            result.launch_failed = true;
            result.error = "Error: failed to stage stdin for " + request.argv.front();
            return result;
        }
        stdin_path = capture.StdinPath().string();
    }

    std::string working_dir = request.working_dir;
    if (working_dir.empty()) {
        working_dir = std::filesystem::current_path().string();
    }

    utils::Log(utils::LogLevel::kDebug, "sandbox", "spawn",
               {{"command", utils::Join(request.argv, " ")}, {"dir", working_dir}});

    const auto started = std::chrono::steady_clock::now();
    try {
        bp::child child_process(
            bp::exe = executable,
            bp::args = args,
            bp::start_dir = working_dir,
            bp::std_in < stdin_path,
            bp::std_out > capture.StdoutPath().string(),
            bp::std_err > capture.StderrPath().string(),
            // Own process group, so the whole tree can be killed at once.
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });

        const pid_t pid = child_process.id();
        // The pid is reaped by hand below; keep boost from waiting on it again.
        child_process.detach();

        const auto deadline = started + request.timeout;
        const auto wait = WaitForExit(pid, deadline);
        if (wait == WaitOutcome::kFailed) {
            const int wait_errno = errno;
            result.elapsed = std::chrono::steady_clock::now() - started;
            result.launch_failed = true;
            result.exit_code = -1;
            result.error = std::string("Error: wait failed: ") + std::strerror(wait_errno);
            utils::Log(utils::LogLevel::kError, "sandbox", "wait failed",
                       {{"pid", std::to_string(pid)}, {"error", std::strerror(wait_errno)}});
            return result;
        }
        result.timed_out = wait == WaitOutcome::kDeadline;

        // The leader is still unreaped here, so its pid cannot have been reused.
        ::kill(-pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        result.elapsed = std::chrono::steady_clock::now() - started;

        result.exit_code = result.timed_out ? 124 : DecodeStatus(status);
    } catch (const bp::process_error& ex) {
        result.elapsed = std::chrono::steady_clock::now() - started;
        result.launch_failed = true;
        result.not_found = ex.code().value() == ENOENT;
        result.exit_code = -1;
        result.error = std::string("Error: exec failed: ") + ex.what();
        return result;
    }

    result.output = ReadFile(capture.StdoutPath());
    result.error = ReadFile(capture.StderrPath());

    utils::Log(utils::LogLevel::kDebug, "sandbox", "exit",
               {{"code", std::to_string(result.exit_code)},
                {"timed_out", result.timed_out ? "true" : "false"}});
    return result;
}

}  // namespace coderun::sandbox
