#include "tools/ProcessRunner.hpp"
#include "errors.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

extern char** environ;

namespace sdp_assistant {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit, bool& truncated) {
    if (n <= 0) return;
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<std::size_t>(n)) truncated = true;
}

// Reads whatever is available; returns false once the pipe hit EOF or failed
bool drain(int fd, std::string& dst, std::size_t limit, bool& truncated) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            append_limited(dst, buf, n, limit, truncated);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

bool is_executable_file(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

// Current environment minus the named variables, as NAME=value strings
std::vector<std::string> inherited_environment(const std::vector<std::string>& excluded) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string name = entry.substr(0, entry.find('='));
        if (std::find(excluded.begin(), excluded.end(), name) == excluded.end()) out.push_back(std::move(entry));
    }
    return out;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

std::string ProcessRunner::find_executable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string path_list = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream ss(path_list);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) return candidate;
    }
    return "";
}

ProcessResult ProcessRunner::run(const ProcessSpec& spec) {
    ProcessResult result;
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // child reports exec errno here; closes on successful exec

    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(saved));
    }

    // Build argv before fork so the child only calls async-signal-safe functions
    std::vector<std::string> all = {spec.command};
    all.insert(all.end(), spec.argv.begin(), spec.argv.end());
    std::vector<char*> argv;
    argv.reserve(all.size() + 1);
    for (auto& s : all) argv.push_back(s.data());
    argv.push_back(nullptr);

    std::vector<std::string> env = inherited_environment(spec.env_exclude);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        close(exec_pipe[0]);

        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
            int e = errno;
            ssize_t ignored = write(exec_pipe[1], &e, sizeof(e));
            (void)ignored;
            _exit(127);
        }

        execve(spec.command.c_str(), argv.data(), envp.data());
        int e = errno;
        ssize_t ignored = write(exec_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        if (exec_errno == ENOENT) {
            throw ToolNotFoundError("External tool could not be started: " + spec.command + " (" +
                                    std::strerror(exec_errno) + ")");
        }
        throw std::runtime_error("Failed to start " + spec.command + ": " + std::strerror(exec_errno));
    }

    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
    int status = 0;
    bool out_open = true;
    bool err_open = true;

    while (true) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
        if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};
        if (nfds > 0) {
            poll(fds, nfds, 50);
        } else {
            usleep(2000);
        }

        if (out_open) out_open = drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
        if (err_open) err_open = drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

        // Peek without reaping so the group id cannot be recycled before the kill
        siginfo_t info{};
        if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) {
            kill(-pid, SIGKILL);   // background jobs the script left behind
            waitpid(pid, &status, 0);
            break;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            break;
        }
    }

    // Pick up anything written between the last poll and exit
    if (out_open) drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
    if (err_open) drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (result.stdout_truncated) result.stdout_text += "(truncated)";
    if (result.stderr_truncated) result.stderr_text += "(truncated)";

    if (result.timed_out) {
        result.exit_code = 124;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    spdlog::debug("Process {} finished: exit={} timed_out={} stdout={}B stderr={}B", spec.command,
                  result.exit_code, result.timed_out, result.stdout_text.size(), result.stderr_text.size());
    return result;
}

} // namespace sdp_assistant
