#include "execute_cmd.hpp"
#include "tool_util.hpp"
#include "../util.hpp"
#include <array>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace toolcore {

namespace {

std::error_code errno_code() {
    return std::error_code(errno, std::generic_category());
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Drain stdout and stderr until both reach EOF.
bool read_all(int out_fd, int err_fd, std::string& out, std::string& err) {
    std::array<char, 4096> buffer;
    struct pollfd pfds[2];
    pfds[0].fd = out_fd;
    pfds[0].events = POLLIN;
    pfds[1].fd = err_fd;
    pfds[1].events = POLLIN;
    std::string* sinks[2] = {&out, &err};

    while (pfds[0].fd >= 0 || pfds[1].fd >= 0) {
        int ret = ::poll(pfds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        for (int i = 0; i < 2; ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            ssize_t n = ::read(pfds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                // EOF or error: stop polling this stream. poll ignores
                // negative descriptors.
                pfds[i].fd = -1;
            }
        }
    }
    return true;
}

} // namespace

ExecuteCmd ExecuteCmd::from_json(const nlohmann::json& args) {
    require_object(args);
    return ExecuteCmd{require_string(args, "command")};
}

std::optional<std::string> ExecuteCmd::validate() const {
    if (command.empty()) return std::string("Command must not be empty");
    return std::nullopt;
}

std::string ExecuteCmd::resolve_shell(const SystemProvider& provider, const Platform& platform,
                                      const ExecuteCmdOptions& options) const {
    if (auto shell = provider.env_var(kShellEnvVar); shell && !shell->empty()) {
        return *shell;
    }
    if (!options.shell.empty()) return options.shell;
    return platform.default_shell();
}

std::map<std::string, std::string> ExecuteCmd::child_env(const SystemProvider& provider,
                                                         const ExecuteCmdOptions& options) {
    std::map<std::string, std::string> env = options.env;
    env[kUserAgentEnvVar] = kUserAgentAppName;
    env[kUserAgentVersionKey] = TOOLCORE_VERSION;
    expand_env_vars(env, [&provider](const std::string& name) { return provider.env_var(name); });
    return env;
}

ToolExecutionResult ExecuteCmd::execute(const SystemProvider& provider, const Platform& platform,
                                        const ExecuteCmdOptions& options) const {
    std::string shell = resolve_shell(provider, platform, options);
    std::vector<std::string> args = platform.shell_command(shell, command);
    auto injected = child_env(provider, options);

    // Inherited environment with the injected variables layered on top.
    std::vector<std::string> env_strings;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && injected.count(entry.substr(0, eq))) continue;
        env_strings.push_back(std::move(entry));
    }
    for (const auto& [key, value] : injected) {
        env_strings.push_back(key + "=" + value);
    }

    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& e : env_strings) envp.push_back(e.data());
    envp.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    // Write ends must not leak into children forked by other threads.
    // dup2 clears the flag on the child's stdout and stderr.
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        auto ec = errno_code();
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return ToolExecutionError::io("failed to create pipes for command", ec);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto ec = errno_code();
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return ToolExecutionError::io("failed to execute command", ec);
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[0]);
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        int exec_errno = errno;
        ssize_t ignored = ::write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // The exec pipe closes on a successful exec; data means it failed.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    std::string out;
    std::string err;
    bool read_ok = true;
    if (n != static_cast<ssize_t>(sizeof(exec_errno))) {
        read_ok = read_all(out_pipe[0], err_pipe[0], out, err);
    }
    auto read_ec = errno_code();
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return ToolExecutionError::io("failed to execute command: " + shell,
                                      std::error_code(exec_errno, std::generic_category()));
    }
    if (!read_ok) {
        return ToolExecutionError::io("failed to read command output", read_ec);
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    std::string result = to_utf8_lossy(out);
    std::string stderr_text = to_utf8_lossy(err);
    if (!stderr_text.empty()) {
        if (!result.empty()) {
            if (result.back() != '\n') result += '\n';
            result += '\n';
        }
        result += stderr_text;
    }
    truncate_safe_in_place(result, options.max_output_bytes, "\n... (output truncated)");
    if (result.empty()) {
        result = "Command exited with code " + std::to_string(exit_code);
    }

    return ToolExecutionOutput::text(std::move(result));
}

std::string ExecuteCmd::description() {
    return R"(A tool for executing shell commands.

WHEN TO USE THIS TOOL:
- Use only as a last resort when no other available tool can accomplish the task

HOW TO USE:
- Provide the command to execute

LIMITATIONS:
- Runs non-interactively and does not load the user's shell profile
- stdin is not available to the command
- Output is returned once the command has finished

TIPS:
- Use the fsRead and fsWrite tools for reading and modifying files
)";
}

const char* ExecuteCmd::input_schema() {
    return R"json({
    "type": "object",
    "properties": {
        "command": {
            "type": "string",
            "description": "Command to execute"
        }
    },
    "required": ["command"]
})json";
}

} // namespace toolcore
