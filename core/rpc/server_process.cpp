#include "server_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <thread>

#include "logging/logger.hpp"

extern char **environ;

namespace toolproxy {
namespace rpc {

namespace {

constexpr int kTermWaitMs = 500;
constexpr int kKillWaitMs = 500;

std::once_flag g_sigpipe_once;

bool is_executable_file(const std::string &path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

void close_pair(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

}  // namespace

ServerProcess::ServerProcess(const std::string &server_name, const std::string &command,
                             const std::vector<std::string> &args, const std::map<std::string, std::string> &env,
                             int shutdown_grace_ms)
    : server_name_(server_name),
      command_(command),
      args_(args),
      env_(env),
      shutdown_grace_ms_(shutdown_grace_ms),
      pid_(-1) {}

ServerProcess::~ServerProcess() { shutdown(); }

std::optional<std::string> ServerProcess::resolve_executable(const std::string &command,
                                                             const std::map<std::string, std::string> &env) {
    if (command.empty()) {
        return std::nullopt;
    }

    if (command.find('/') != std::string::npos) {
        if (!is_executable_file(command)) {
            return std::nullopt;
        }
        return std::filesystem::absolute(command).string();
    }

    std::string path_var;
    auto it = env.find("PATH");
    if (it != env.end()) {
        path_var = it->second;
    } else if (const char *p = std::getenv("PATH")) {
        path_var = p;
    } else {
        path_var = "/usr/local/bin:/usr/bin:/bin";
    }

    size_t start = 0;
    while (start <= path_var.size()) {
        size_t end = path_var.find(':', start);
        if (end == std::string::npos) {
            end = path_var.size();
        }
        std::string dir = path_var.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + command;
        if (is_executable_file(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::vector<std::string> ServerProcess::build_environment() const {
    std::map<std::string, std::string> merged;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto &[key, value] : env_) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto &[key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

bool ServerProcess::spawn() {
    error_.clear();
    LOG_INFO("[" << server_name_ << "] Spawning: " << command_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_ > 0 && !exit_status_) {
            error_ = "Process already running";
            LOG_ERROR("[" << server_name_ << "] " << error_);
            return false;
        }
    }

    auto resolved = resolve_executable(command_, env_);
    if (!resolved) {
        error_ = "Executable not found: " + command_;
        LOG_ERROR("[" << server_name_ << "] " << error_);
        return false;
    }

    // Writes to a dead child must fail with EPIPE instead of killing us
    std::call_once(g_sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });

    // Everything the child touches is prepared before fork
    std::vector<std::string> argv_storage;
    argv_storage.push_back(command_);
    argv_storage.insert(argv_storage.end(), args_.begin(), args_.end());
    std::vector<std::string> env_storage = build_environment();

    std::vector<char *> argv;
    for (auto &arg : argv_storage) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char *> envp;
    for (auto &kv : env_storage) {
        envp.push_back(const_cast<char *>(kv.c_str()));
    }
    envp.push_back(nullptr);

    // Close-on-exec everywhere: sibling servers must not inherit our pipe ends
    int stdin_pipe[2];
    int stdout_pipe[2];
    int status_pipe[2];

    if (pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdin pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        close_pair(stdin_pipe);
        return false;
    }
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create status pipe: " + std::string(strerror(errno));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(status_pipe);
        return false;
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        // stderr stays connected to parent's stderr

        execve(resolved->c_str(), argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(status_pipe[1]);

    // EOF on the status pipe means exec succeeded
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        error_ = "exec failed for " + *resolved + ": " + std::string(strerror(exec_errno));
        LOG_ERROR("[" << server_name_ << "] " << error_);
        return false;
    }

    client_.set_handles(stdin_pipe[1], stdout_pipe[0]);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = pid;
        exit_status_.reset();
    }

    LOG_INFO("[" << server_name_ << "] Process spawned successfully (PID=" << pid << ")");
    return true;
}

pid_t ServerProcess::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

std::optional<int> ServerProcess::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_status_;
}

bool ServerProcess::reap(bool block) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || exit_status_) {
        return true;
    }

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, block ? 0 : WNOHANG);
        if (result == pid_) {
            if (WIFEXITED(status)) {
                exit_status_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_status_ = 128 + WTERMSIG(status);
            } else {
                exit_status_ = -1;
            }
            return true;
        }
        if (result == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // ECHILD: reaped elsewhere; nothing left to wait for
        exit_status_ = -1;
        return true;
    }
}

bool ServerProcess::is_running() { return !reap(false); }

bool ServerProcess::wait_for_exit(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (reap(false)) {
            return true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ServerProcess::send_signal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0 && !exit_status_) {
        kill(pid_, sig);
    }
}

void ServerProcess::kill_now() { send_signal(SIGKILL); }

void ServerProcess::shutdown() {
    if (!is_running()) {
        client_.close_stdin();
        return;
    }

    LOG_INFO("[" << server_name_ << "] Initiating shutdown");

    // 1. Send EOF
    client_.close_stdin();

    // 2. Wait for a voluntary exit
    if (wait_for_exit(shutdown_grace_ms_)) {
        LOG_INFO("[" << server_name_ << "] Clean shutdown (status " << exit_status().value_or(-1) << ")");
        return;
    }

    // 3. Ask politely, then force
    LOG_WARN("[" << server_name_ << "] Grace period elapsed - sending SIGTERM");
    send_signal(SIGTERM);
    if (wait_for_exit(kTermWaitMs)) {
        return;
    }

    LOG_WARN("[" << server_name_ << "] Timeout - forcing termination");
    send_signal(SIGKILL);
    if (!wait_for_exit(kKillWaitMs)) {
        reap(true);
    }
}

}  // namespace rpc
}  // namespace toolproxy
