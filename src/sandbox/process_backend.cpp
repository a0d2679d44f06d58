#include "sandbox/process_backend.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif

#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/backend_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

std::atomic<unsigned long> g_call_counter{0};

std::string MakeStamp() {
    std::ostringstream stamp;
    stamp << ::getpid() << "_"
          << std::chrono::steady_clock::now().time_since_epoch().count() << "_"
          << g_call_counter.fetch_add(1);
    return stamp.str();
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

std::string ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    const auto found = bp::search_path(name);
    return found.empty() ? std::string() : found.string();
}

pid_t WaitNoHang(pid_t pid, int& status) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited >= 0 || errno != EINTR) {
            return waited;
        }
    }
}

// Removes the per-call temp files on every exit path.
class TempFiles {
public:
    explicit TempFiles(const std::string& stamp)
        : stdin_path_(std::filesystem::temp_directory_path() / ("codebox_stdin_" + stamp)),
          stdout_path_(std::filesystem::temp_directory_path() / ("codebox_stdout_" + stamp + ".log")),
          stderr_path_(std::filesystem::temp_directory_path() / ("codebox_stderr_" + stamp + ".log")) {}

    ~TempFiles() {
        std::error_code ec;
        std::filesystem::remove(stdin_path_, ec);
        std::filesystem::remove(stdout_path_, ec);
        std::filesystem::remove(stderr_path_, ec);
    }

    TempFiles(const TempFiles&) = delete;
    TempFiles& operator=(const TempFiles&) = delete;

    const std::filesystem::path& StdinPath() const { return stdin_path_; }
    const std::filesystem::path& StdoutPath() const { return stdout_path_; }
    const std::filesystem::path& StderrPath() const { return stderr_path_; }

private:
    std::filesystem::path stdin_path_;
    std::filesystem::path stdout_path_;
    std::filesystem::path stderr_path_;
};

}  // namespace

ProcessBackend::ProcessBackend(std::chrono::seconds kill_grace)
    : kill_grace_(kill_grace) {}

bool ProcessBackend::WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status,
                               std::chrono::milliseconds interval) {
    while (true) {
        const auto waited = WaitNoHang(pid, status);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            throw MalformedResponseError("waitpid failed for process " + std::to_string(pid) + ": " +
                                         std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(interval);
    }
}

ExecResponse ProcessBackend::Exec(const ExecRequest& request) {
    if (request.command.empty()) {
        throw SpawnError("empty command");
    }
    const auto executable = ResolveExecutable(request.command.front());
    if (executable.empty()) {
        throw SpawnError("command not found: " + request.command.front());
    }
    const std::vector<std::string> args(request.command.begin() + 1, request.command.end());

    std::string start_dir = request.working_dir;
    if (start_dir.empty()) {
        std::error_code ec;
        start_dir = std::filesystem::current_path(ec).string();
    }

    TempFiles files(MakeStamp());
    {
        std::ofstream input(files.StdinPath(), std::ios::binary | std::ios::trunc);
        if (!input.is_open()) {
            throw SpawnError("cannot create stdin file " + files.StdinPath().string());
        }
        input << request.input;
        if (!input) {
            throw SpawnError("cannot write stdin file " + files.StdinPath().string());
        }
    }

    codebox::utils::Log(codebox::utils::LogLevel::kDebug, "process",
                        "spawn " + codebox::utils::Join(request.command, " ") + " cwd=" + start_dir);

    ExecResponse response{};
    try {
        bp::child child_process(
            bp::exe = executable,
            bp::args = args,
            bp::start_dir = start_dir,
            bp::std_in < files.StdinPath().string(),
            bp::std_out > files.StdoutPath().string(),
            bp::std_err > files.StderrPath().string());

        const pid_t pid = child_process.id();
        int status = 0;
        bool finished = WaitUntil(pid, std::chrono::steady_clock::now() + request.timeout, status,
                                  std::chrono::milliseconds(50));
        if (!finished) {
            response.timed_out = true;
            ::kill(pid, SIGTERM);
            finished = WaitUntil(pid, std::chrono::steady_clock::now() + kill_grace_, status,
                                 std::chrono::milliseconds(50));
            if (!finished) {
                ::kill(pid, SIGKILL);
                pid_t waited = -1;
                do {
                    waited = ::waitpid(pid, &status, 0);
                } while (waited < 0 && errno == EINTR);
                finished = waited == pid;
            }
        }
        child_process.detach();

        if (response.timed_out) {
            response.exit_status = kTimeoutExitStatus;
        } else if (finished && WIFEXITED(status)) {
            response.exit_status = WEXITSTATUS(status);
        } else if (finished && WIFSIGNALED(status)) {
            response.exit_status = 128 + WTERMSIG(status);
        } else {
            throw MalformedResponseError("lost track of child process " + std::to_string(pid));
        }
    } catch (const bp::process_error& ex) {
        codebox::utils::Log(codebox::utils::LogLevel::kError, "process",
                            std::string("spawn failed: ") + ex.what());
        throw SpawnError(std::string("exec failed: ") + ex.what());
    }

    response.stdout_text = ReadFile(files.StdoutPath());
    response.stderr_text = ReadFile(files.StderrPath());
    return response;
}

}  // namespace codebox::sandbox
