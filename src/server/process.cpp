#include "src/server/process.h"
#include "src/server/logger.h"

#include <fcntl.h>
#include <grp.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace execgate {

namespace fs = std::filesystem;

namespace {

using SteadyClock = std::chrono::steady_clock;

// Setup steps reported back through the status pipe when they fail in the child.
enum ChildStage {
    kStageIo = 1,
    kStageChdir,
    kStageCredentials,
    kStageExec
};

const char* ChildStageName(int stage) {
    switch (stage) {
        case kStageIo: return "redirect stdio";
        case kStageChdir: return "chdir";
        case kStageCredentials: return "drop privileges";
        case kStageExec: return "execve";
        default: return "setup";
    }
}

[[noreturn]] void ChildFail(int status_fd, int stage) {
    int report[2] = {stage, errno};
    ssize_t ignored = write(status_fd, report, sizeof(report));
    (void)ignored;
    _exit(127);
}

void SetLimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit limit;
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    setrlimit(resource, &limit);
}

void AppendLimited(std::string& dst, const char* src, ssize_t n, size_t limit, bool& overflow) {
    if (n <= 0) return;
    size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    size_t take = std::min<size_t>(static_cast<size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<size_t>(n)) overflow = true;
}

// Reads whatever is available without blocking. Clears `open` at EOF.
void ReadAvailable(int fd, bool& open, std::string& dst, size_t limit, bool& overflow) {
    char buffer[4096];
    while (open) {
        ssize_t bytes = read(fd, buffer, sizeof(buffer));
        if (bytes > 0) {
            AppendLimited(dst, buffer, bytes, limit, overflow);
            continue;
        }
        if (bytes == 0) {
            open = false;
        } else if (errno == EINTR) {
            continue;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
            Logger::Warn("Read from child pipe failed: ", strerror(errno));
            open = false;
        }
        break;
    }
}

// Waits up to `wait` for either pipe to become readable.
void WaitReadable(int out_fd, bool out_open, int err_fd, bool err_open, std::chrono::microseconds wait) {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    int max_fd = -1;
    if (out_open) {
        FD_SET(out_fd, &read_fds);
        max_fd = std::max(max_fd, out_fd);
    }
    if (err_open) {
        FD_SET(err_fd, &read_fds);
        max_fd = std::max(max_fd, err_fd);
    }

    struct timeval timeout;
    timeout.tv_sec = static_cast<time_t>(wait.count() / 1000000);
    timeout.tv_usec = static_cast<suseconds_t>(wait.count() % 1000000);
    int activity = select(max_fd + 1, max_fd >= 0 ? &read_fds : nullptr, nullptr, nullptr, &timeout);
    if (activity < 0 && errno != EINTR) {
        Logger::Warn("Select error: ", strerror(errno));
    }
}

void ClosePipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

} // namespace

std::string Process::CreateTempDirectory(const std::string& root) {
    std::string pattern = (fs::path(root) / "execgate_run_XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    char* path = mkdtemp(buffer.data());
    if (!path) {
        Logger::Error("Failed to create temporary directory under ", root, ": ", strerror(errno));
        return "";
    }
    Logger::Debug("Created temporary directory: ", path);
    return std::string(path);
}

bool Process::RemoveDirectory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        Logger::Error("Failed to remove directory: ", path, " - ", ec.message());
        return false;
    }
    Logger::Debug("Removed directory: ", path);
    return true;
}

bool Process::WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        Logger::Error("Failed to open file for writing: ", path);
        return false;
    }
    out << content;
    out.close();
    if (!out) {
        Logger::Error("Failed to write file: ", path);
        return false;
    }
    return true;
}

std::string Process::ResolveExecutable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

ProcessResult Process::Run(const ProcessSpec& spec) {
    ProcessResult result;

    if (spec.argv.empty()) {
        result.error_message = "empty command line";
        return result;
    }
    std::string executable = ResolveExecutable(spec.argv[0]);
    if (executable.empty()) {
        result.error_message = "executable not found: " + spec.argv[0];
        return result;
    }

    // Everything the child needs is prepared before fork.
    std::vector<char*> c_argv;
    for (const auto& arg : spec.argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
    c_argv.push_back(nullptr);
    std::vector<char*> c_envp;
    for (const auto& var : spec.env) c_envp.push_back(const_cast<char*>(var.c_str()));
    c_envp.push_back(nullptr);

    long max_fd = 1024;
    struct rlimit nofile;
    if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY) {
        max_fd = static_cast<long>(std::min<rlim_t>(nofile.rlim_cur, 65536));
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1 || pipe2(stderr_pipe, O_CLOEXEC) == -1 ||
        pipe2(status_pipe, O_CLOEXEC) == -1) {
        result.error_message = std::string("failed to create pipes: ") + strerror(errno);
        ClosePipe(stdout_pipe);
        ClosePipe(stderr_pipe);
        ClosePipe(status_pipe);
        return result;
    }

    const pid_t parent_pid = getpid();
    const auto start = SteadyClock::now();
    pid_t pid = fork();
    if (pid == -1) {
        result.error_message = std::string("failed to fork: ") + strerror(errno);
        ClosePipe(stdout_pipe);
        ClosePipe(stderr_pipe);
        ClosePipe(status_pipe);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        int status_fd = status_pipe[1];
        setpgid(0, 0);
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (getppid() != parent_pid) _exit(127);

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) == -1 ||
            dup2(stdout_pipe[1], STDOUT_FILENO) == -1 || dup2(stderr_pipe[1], STDERR_FILENO) == -1) {
            ChildFail(status_fd, kStageIo);
        }

        if (!spec.working_directory.empty() && chdir(spec.working_directory.c_str()) != 0) {
            ChildFail(status_fd, kStageChdir);
        }

        const ResourceLimits& limits = spec.limits;
        if (limits.cpu_time_seconds > 0) {
            SetLimit(RLIMIT_CPU, limits.cpu_time_seconds, limits.cpu_time_seconds + 1);
        }
        if (limits.memory_bytes > 0) SetLimit(RLIMIT_AS, limits.memory_bytes, limits.memory_bytes);
        if (limits.max_processes > 0) SetLimit(RLIMIT_NPROC, limits.max_processes, limits.max_processes);
        if (limits.max_file_bytes > 0) SetLimit(RLIMIT_FSIZE, limits.max_file_bytes, limits.max_file_bytes);

        // Supplementary groups survive setgid/setuid; replace them first. Only
        // a privileged parent can, and only a privileged parent has any to shed.
        if ((spec.run_as_gid || spec.run_as_uid) && geteuid() == 0) {
            int dropped = spec.run_as_gid ? setgroups(1, &*spec.run_as_gid) : setgroups(0, nullptr);
            if (dropped != 0) ChildFail(status_fd, kStageCredentials);
        }
        if (spec.run_as_gid && setgid(*spec.run_as_gid) != 0) ChildFail(status_fd, kStageCredentials);
        if (spec.run_as_uid && setuid(*spec.run_as_uid) != 0) ChildFail(status_fd, kStageCredentials);
        prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);

        for (int fd = 3; fd < max_fd; ++fd) {
            if (fd != status_fd) close(fd);
        }

        execve(executable.c_str(), c_argv.data(), c_envp.data());
        ChildFail(status_fd, kStageExec);
    }

    // Parent
    setpgid(pid, pid);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(status_pipe[1]);

    // Blocks until execve closes the pipe or the child reports a failure.
    int report[2] = {0, 0};
    ssize_t reported;
    do {
        reported = read(status_pipe[0], report, sizeof(report));
    } while (reported < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (reported > 0) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        result.error_message = std::string("child failed to ") + ChildStageName(report[0]) + ": " +
                               strerror(report[1]);
        return result;
    }
    result.started = true;

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    const auto deadline = start + std::chrono::duration_cast<SteadyClock::duration>(
                                      std::chrono::duration<double>(spec.timeout_seconds));
    bool stdout_open = true;
    bool stderr_open = true;
    bool reaped = false;
    int status = 0;

    auto drain = [&]() {
        ReadAvailable(stdout_pipe[0], stdout_open, result.stdout_text, spec.capture_bytes,
                      result.stdout_overflow);
        ReadAvailable(stderr_pipe[0], stderr_open, result.stderr_text, spec.capture_bytes,
                      result.stderr_overflow);
    };

    while (!reaped) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            Logger::Error("waitpid failed: ", strerror(errno));
            result.error_message = std::string("waitpid failed: ") + strerror(errno);
            break;
        }

        auto now = SteadyClock::now();
        if (now >= deadline) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            reaped = true;
            result.timed_out = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);
        WaitReadable(stdout_pipe[0], stdout_open, stderr_pipe[0], stderr_open,
                     std::min(remaining, std::chrono::microseconds(50000)));
        drain();
    }
    result.elapsed_seconds = std::chrono::duration<double>(SteadyClock::now() - start).count();

    // Reclaim anything left in the group, then collect buffered output.
    kill(-pid, SIGKILL);
    const auto drain_deadline = SteadyClock::now() + std::chrono::milliseconds(250);
    drain();
    while ((stdout_open || stderr_open) && SteadyClock::now() < drain_deadline) {
        WaitReadable(stdout_pipe[0], stdout_open, stderr_pipe[0], stderr_open,
                     std::chrono::microseconds(20000));
        drain();
    }
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    if (!reaped) return result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    return result;
}

} // namespace execgate
