/**
 * @file process_runner.cpp
 * @brief POSIX implementation of the process runner
 */

#include "migrator/migration/process_runner.hpp"
#include "migrator/core/redaction.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <optional>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace migrator::migration {

namespace {

using steady = std::chrono::steady_clock;

constexpr int poll_interval_ms = 20;

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

void close_pipe(int (&fds)[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

/**
 * @brief Environment block for the child: the current one plus overrides
 */
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view item(*entry);
        auto eq = item.find('=');
        auto key = std::string(item.substr(0, eq));
        if (overrides.count(key) == 0) {
            env.emplace_back(item);
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

/**
 * @brief Splits raw pipe data into lines and forwards them
 */
class line_splitter {
public:
    line_splitter(process_role role, const line_callback& on_line)
        : role_(role), on_line_(on_line) {}

    void feed(const char* data, std::size_t size) {
        for (std::size_t i = 0; i < size; ++i) {
            char c = data[i];
            if (c == '\n') {
                emit();
            } else {
                pending_.push_back(c);
            }
        }
    }

    void finish() {
        if (!pending_.empty()) {
            emit();
        }
    }

private:
    void emit() {
        if (!pending_.empty() && pending_.back() == '\r') {
            pending_.pop_back();
        }
        if (on_line_) {
            on_line_(role_, pending_);
        }
        pending_.clear();
    }

    process_role role_;
    const line_callback& on_line_;
    std::string pending_;
};

}  // namespace

// =============================================================================
// Construction
// =============================================================================

posix_process_runner::posix_process_runner(std::chrono::milliseconds grace_period,
                                           std::shared_ptr<di::ILogger> logger)
    : grace_period_(grace_period),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Run
// =============================================================================

auto posix_process_runner::run(const process_spec& spec,
                               const line_callback& on_line,
                               const cancellation_token& cancel)
    -> Result<process_result> {
    // Output pipe shared by stdout and stderr, and an exec-status pipe that
    // the child writes errno into when exec fails.
    int out_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    if (pipe(out_pipe) != 0) {
        return migrator_error<process_result>(
            error_codes::process_pipe_failed,
            "Failed to create output pipe", std::strerror(errno));
    }
    if (pipe(exec_pipe) != 0) {
        int err = errno;
        close_pipe(out_pipe);
        return migrator_error<process_result>(
            error_codes::process_pipe_failed,
            "Failed to create status pipe", std::strerror(err));
    }
    set_cloexec(out_pipe[0]);
    set_cloexec(out_pipe[1]);
    set_cloexec(exec_pipe[0]);
    set_cloexec(exec_pipe[1]);

    // Everything the child needs is prepared before fork().
    std::vector<std::string> env_storage = build_environment(spec.environment);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& item : env_storage) {
        envp.push_back(item.data());
    }
    envp.push_back(nullptr);

    std::string executable = spec.executable;
    std::vector<std::string> arg_storage = spec.args;
    std::vector<char*> argv;
    argv.reserve(arg_storage.size() + 2);
    argv.push_back(executable.data());
    for (auto& arg : arg_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    logger_->debug_fmt("Spawning {} process: {}", to_string(spec.role),
                       redact_credentials(spec.command_line()));

    auto start_time = steady::now();
    pid_t pid = fork();

    if (pid < 0) {
        int err = errno;
        close_pipe(out_pipe);
        close_pipe(exec_pipe);
        return migrator_error<process_result>(
            error_codes::process_spawn_failed,
            "Failed to fork " + spec.executable, std::strerror(err));
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        close(out_pipe[0]);
        close(exec_pipe[0]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);

        environ = envp.data();
        execvp(executable.c_str(), argv.data());

        int err = errno;
        ssize_t written = write(exec_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    // Parent process
    setpgid(pid, pid);
    close(out_pipe[1]);
    out_pipe[1] = -1;
    close(exec_pipe[1]);
    exec_pipe[1] = -1;

    int exec_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);
    close(exec_pipe[0]);
    exec_pipe[0] = -1;

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close(out_pipe[0]);
        logger_->warn_fmt("Failed to start {}: {}", spec.executable,
                          std::strerror(exec_errno));
        return migrator_error<process_result>(
            error_codes::process_spawn_failed,
            "Failed to start " + spec.executable, std::strerror(exec_errno));
    }

    fcntl(out_pipe[0], F_SETFL, fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);

    process_result result;
    line_splitter splitter(spec.role, on_line);
    std::array<char, 4096> buffer{};
    bool pipe_open = true;
    bool reaped = false;
    int status = 0;
    std::optional<steady::time_point> term_sent_at;

    auto drain = [&]() {
        while (pipe_open) {
            ssize_t n = read(out_pipe[0], buffer.data(), buffer.size());
            if (n > 0) {
                splitter.feed(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0) {
                pipe_open = false;
            } else if (errno == EINTR) {
                continue;
            } else {
                // EAGAIN: nothing more for now
                break;
            }
        }
    };

    while (!reaped) {
        auto now = steady::now();

        if (!term_sent_at) {
            bool expired = spec.timeout.count() > 0 && now - start_time >= spec.timeout;
            if (cancel.is_cancelled() || expired) {
                result.timed_out = expired && !cancel.is_cancelled();
                logger_->info_fmt("Terminating {} process group {}",
                                  to_string(spec.role), pid);
                killpg(pid, SIGTERM);
                term_sent_at = now;
                result.signaled_termination = true;
            }
        } else if (!result.force_killed && now - *term_sent_at >= grace_period_) {
            logger_->warn_fmt("{} process {} ignored SIGTERM, sending SIGKILL",
                              to_string(spec.role), pid);
            killpg(pid, SIGKILL);
            result.force_killed = true;
        }

        if (pipe_open) {
            pollfd pfd{out_pipe[0], POLLIN, 0};
            int ready = poll(&pfd, 1, poll_interval_ms);
            if (ready > 0) {
                drain();
            }
        } else {
            poll(nullptr, 0, poll_interval_ms);
        }

        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
        } else if (waited < 0 && errno != EINTR) {
            int err = errno;
            killpg(pid, SIGKILL);
            close(out_pipe[0]);
            return migrator_error<process_result>(
                error_codes::process_wait_failed,
                "Failed to wait for " + spec.executable, std::strerror(err));
        }
    }

    drain();
    splitter.finish();
    close(out_pipe[0]);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -WTERMSIG(status);
        result.signaled_termination = true;
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        steady::now() - start_time);

    logger_->debug_fmt("{} process {} exited with code {} after {} ms",
                       to_string(spec.role), pid, result.exit_code,
                       result.duration.count());

    return ok(result);
}

}  // namespace migrator::migration
