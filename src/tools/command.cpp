#include "command.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace tooledchat {

// A child that exits without reading its stdin must not take us down
static void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

static void kill_and_reap(pid_t pid) {
    // The child called setsid(), so its pid is also its process group
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

CommandTool::CommandTool(ToolDefinition definition)
    : def_(std::move(definition)) {
    if (def_.command.empty()) {
        throw std::invalid_argument("Tool " + def_.name + " has no command");
    }
}

std::string CommandTool::env_var_name(const std::string& param) {
    std::string name = "TOOL_ARG_";
    for (char c : param) {
        auto u = static_cast<unsigned char>(c);
        name += std::isalnum(u) ? static_cast<char>(std::toupper(u)) : '_';
    }
    return name;
}

nlohmann::json CommandTool::execute(const BoundArguments& args,
                                    const CancellationToken& cancel) {
    ignore_sigpipe();

    // Inherited environment plus one variable per bound argument
    std::vector<std::string> env_strings;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "TOOL_ARG_", 9) == 0) continue;
        env_strings.emplace_back(*e);
    }
    for (const auto& [key, value] : args.items()) {
        env_strings.push_back(env_var_name(key) + "=" +
                              (value.is_string() ? value.get<std::string>() : value.dump()));
    }
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::string input = args.dump();

    int stdin_pipe[2];
    int stdout_pipe[2];
    if (pipe(stdin_pipe) != 0) {
        throw std::runtime_error("Failed to create pipes");
    }
    if (pipe(stdout_pipe) != 0) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        throw std::runtime_error("Failed to create pipes");
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw std::runtime_error("Failed to fork process");
    }

    if (pid == 0) {
        // Child runs in its own process group so a kill reaches the whole tree
        setsid();
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdin_pipe[0]);
        close(stdout_pipe[1]);
        const char* argv[] = {"sh", "-c", def_.command.c_str(), nullptr};
        execve("/bin/sh", const_cast<char* const*>(argv), envp.data());
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    // Stdin is fed from the poll loop so a child that never reads it cannot
    // stall us past the deadline
    int stdin_fd = stdin_pipe[1];
    int stdout_fd = stdout_pipe[0];
    fcntl(stdin_fd, F_SETFL, fcntl(stdin_fd, F_GETFL) | O_NONBLOCK);
    size_t written = 0;

    auto close_stdin = [&]() {
        if (stdin_fd >= 0) {
            close(stdin_fd);
            stdin_fd = -1;
        }
    };
    if (input.empty()) close_stdin();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(def_.timeout);

    auto check_abort = [&]() {
        if (cancel.cancelled()) {
            close_stdin();
            close(stdout_fd);
            kill_and_reap(pid);
            throw Error(ErrorKind::Cancelled, "Cancelled while running " + def_.name);
        }
        if (def_.timeout > 0 && std::chrono::steady_clock::now() >= deadline) {
            close_stdin();
            close(stdout_fd);
            kill_and_reap(pid);
            std::cerr << "[tool] " << def_.name << " timed out\n";
            throw std::runtime_error(def_.name + " timed out after " +
                                     std::to_string(def_.timeout) + "s");
        }
    };

    std::string output;
    bool truncated = false;
    std::array<char, 4096> buffer;

    while (true) {
        check_abort();

        std::array<struct pollfd, 2> fds{};
        fds[0].fd = stdout_fd;
        fds[0].events = POLLIN;
        nfds_t count = 1;
        if (stdin_fd >= 0) {
            fds[1].fd = stdin_fd;
            fds[1].events = POLLOUT;
            count = 2;
        }

        int ret = poll(fds.data(), count, kPollIntervalMs);
        if (ret < 0) {
            if (errno == EINTR) continue;
            close_stdin();
            close(stdout_fd);
            kill_and_reap(pid);
            throw std::runtime_error("Failed to read output of " + def_.name);
        }
        if (ret == 0) continue;

        if (count == 2 && fds[1].revents != 0) {
            if ((fds[1].revents & POLLOUT) != 0) {
                ssize_t n = write(stdin_fd, input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == input.size()) close_stdin();
                } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
                    close_stdin(); // child closed stdin; it doesn't want the JSON
                }
            } else {
                close_stdin();
            }
        }

        if ((fds[0].revents & POLLIN) != 0) {
            ssize_t n = read(stdout_fd, buffer.data(), buffer.size());
            if (n > 0) {
                size_t room = output.size() < kMaxOutput ? kMaxOutput - output.size() : 0;
                size_t take = std::min(room, static_cast<size_t>(n));
                output.append(buffer.data(), take);
                if (take < static_cast<size_t>(n)) truncated = true;
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break; // EOF
        }

        if ((fds[0].revents & (POLLHUP | POLLERR)) != 0) {
            break;
        }
    }
    close_stdin();

    // Output closed; the process may still be winding down
    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            close(stdout_fd);
            throw std::runtime_error("Failed to wait for " + def_.name);
        }
        check_abort();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    close(stdout_fd);

    std::string text = trim(output);

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::string reason = WIFSIGNALED(status)
            ? "was killed by signal " + std::to_string(WTERMSIG(status))
            : "exited with status " + std::to_string(WEXITSTATUS(status));
        std::cerr << "[tool] " << def_.name << " " << reason << '\n';
        std::string detail = text.size() > 200 ? text.substr(0, 200) + "..." : text;
        throw std::runtime_error(def_.name + " " + reason +
                                 (detail.empty() ? "" : ": " + detail));
    }

    if (truncated) {
        return text + "\n[truncated]";
    }
    if (nlohmann::json::accept(text)) {
        return nlohmann::json::parse(text);
    }
    return text;
}

std::vector<std::shared_ptr<Tool>> create_command_tools(const std::vector<ToolDefinition>& defs) {
    std::vector<std::shared_ptr<Tool>> tools;
    tools.reserve(defs.size());
    for (const auto& def : defs) {
        tools.push_back(std::make_shared<CommandTool>(def));
    }
    return tools;
}

} // namespace tooledchat
