#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <array>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace iscsi_dev {

OsError::OsError(const std::string& msg, int code)
    : IscsiError(msg + ": " + std::strerror(code)), code_(code) {}

void throw_os_error(const std::string& what) {
    int err = errno;
    if (err == ENOENT) {
        throw NotFoundError(what, err);
    }
    throw OsError(what, err);
}

bool is_root() {
    return geteuid() == 0;
}

bool path_exists(const std::string& path) {
    struct stat st;
    return lstat(path.c_str(), &st) == 0;
}

bool directory_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string result;
    for (const auto& arg : argv) {
        if (!result.empty()) {
            result += ' ';
        }
        result += arg;
    }
    return result;
}

CommandResult execute_command(const std::vector<std::string>& argv) {
    std::string cmd = join_command(argv);
    if (argv.empty()) {
        throw CommandError("Empty command", cmd, -1, "");
    }

    spdlog::debug("Executing: {}", cmd);

    int pipe_fd[2] = {-1, -1};
    if (pipe2(pipe_fd, O_CLOEXEC) < 0) {
        throw CommandError("Failed to create pipe for " + cmd, cmd, -1, "");
    }

    // argv для execvp готовим до fork
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        ::close(pipe_fd[0]);
        ::close(pipe_fd[1]);
        throw CommandError("Failed to fork for " + cmd, cmd, -1, "");
    }

    if (pid == 0) {
        // Child process: stdout и stderr в общий pipe, stdin из /dev/null
        dup2(pipe_fd[1], STDOUT_FILENO);
        dup2(pipe_fd[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }

        execvp(args[0], args.data());
        _exit(127);
    }

    // Parent process
    ::close(pipe_fd[1]);

    std::array<char, 4096> buffer;
    std::string output;
    for (;;) {
        ssize_t n = ::read(pipe_fd[0], buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        output.append(buffer.data(), static_cast<size_t>(n));
    }
    ::close(pipe_fd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw CommandError("Failed to wait for " + cmd, cmd, -1, output);
        }
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code == 127) {
        throw CommandError("Failed to execute command: " + cmd, cmd, exit_code, output);
    }
    return CommandResult{exit_code, output};
}

std::string execute_command_output(const std::vector<std::string>& argv) {
    CommandResult result = execute_command(argv);
    std::string cmd = join_command(argv);

    if (result.exit_code != 0) {
        spdlog::debug("Command '{}' exited with {}: {}", cmd, result.exit_code, result.output);
        throw CommandError("Command failed: " + cmd + ": " + result.output,
                           cmd, result.exit_code, result.output);
    }

    // Trim trailing newline
    std::string& output = result.output;
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
    }

    return output;
}

std::vector<std::string> get_local_ips() {
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        throw_os_error("Failed to list network interfaces");
    }

    std::vector<std::string> result;
    for (struct ifaddrs* ifa = addrs; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        char buffer[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer)) != nullptr) {
            result.emplace_back(buffer);
        }
    }

    freeifaddrs(addrs);
    return result;
}

} // namespace iscsi_dev
