#include "converter/Process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

ToolNotFoundError::ToolNotFoundError(const std::string& tool)
    : std::runtime_error(tool + " not found"),
      tool_(tool) {}

namespace {
bool IsExecutableFile(const std::filesystem::path& candidate) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec)) {
        return false;
    }
    return access(candidate.c_str(), X_OK) == 0;
}

// Owns both ends of a pipe until they are handed off or closed.
struct Pipe {
    int read_fd = -1;
    int write_fd = -1;

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    void Open() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) {
            throw std::runtime_error(std::string("Could not create pipe: ") + std::strerror(errno));
        }
        read_fd = fds[0];
        write_fd = fds[1];
    }

    void CloseRead() {
        if (read_fd >= 0) {
            close(read_fd);
            read_fd = -1;
        }
    }

    void CloseWrite() {
        if (write_fd >= 0) {
            close(write_fd);
            write_fd = -1;
        }
    }
};

class SpawnActions {
public:
    SpawnActions() { posix_spawn_file_actions_init(&actions_); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }
    posix_spawn_file_actions_t* get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

class SpawnAttributes {
public:
    SpawnAttributes() { posix_spawnattr_init(&attr_); }
    ~SpawnAttributes() { posix_spawnattr_destroy(&attr_); }
    posix_spawnattr_t* get() { return &attr_; }

private:
    posix_spawnattr_t attr_;
};

void EmitLines(std::string& pending, const std::function<void(const std::string&)>& on_line) {
    std::size_t newline = pending.find('\n');
    while (newline != std::string::npos) {
        std::string line = pending.substr(0, newline);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (on_line) {
            on_line(line);
        }
        pending.erase(0, newline + 1);
        newline = pending.find('\n');
    }
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int WaitForChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return DecodeStatus(status);
}
} // namespace

std::string FindExecutable(const std::string& program) {
    if (program.empty()) {
        return {};
    }
    if (program.find('/') != std::string::npos) {
        return IsExecutableFile(program) ? program : std::string();
    }

    const char* env_path = std::getenv("PATH");
    const std::string search_path = (env_path != nullptr && *env_path != '\0') ? env_path : "/usr/local/bin:/usr/bin:/bin";

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / program;
        if (IsExecutableFile(candidate)) {
            return candidate.string();
        }
    }
    return {};
}

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const std::atomic<bool>* cancel_flag,
                         const std::function<void(const std::string&)>& on_stdout_line) {
    if (argv.empty()) {
        throw std::invalid_argument("RunProcess needs a program to run");
    }

    const std::string executable = FindExecutable(argv.front());
    if (executable.empty()) {
        throw ToolNotFoundError(argv.front());
    }

    Pipe out_pipe;
    Pipe err_pipe;
    out_pipe.Open();
    err_pipe.Open();

    SpawnActions actions;
    posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(actions.get(), out_pipe.write_fd, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(actions.get(), err_pipe.write_fd, STDERR_FILENO);

    // Own process group so cancellation reaches anything the tool forks and the
    // terminal's Ctrl-C stays with us.
    SpawnAttributes attributes;
    posix_spawnattr_setflags(attributes.get(), POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(attributes.get(), 0);

    std::vector<char*> raw_argv;
    raw_argv.reserve(argv.size() + 1);
    raw_argv.push_back(const_cast<char*>(executable.c_str()));
    for (std::size_t i = 1; i < argv.size(); ++i) {
        raw_argv.push_back(const_cast<char*>(argv[i].c_str()));
    }
    raw_argv.push_back(nullptr);

    pid_t pid = 0;
    const int spawn_error = posix_spawn(&pid, executable.c_str(), actions.get(), attributes.get(), raw_argv.data(), environ);
    if (spawn_error == ENOENT || spawn_error == EACCES || spawn_error == ENOEXEC) {
        throw ToolNotFoundError(argv.front());
    }
    if (spawn_error != 0) {
        throw std::runtime_error("Could not start " + argv.front() + ": " + std::strerror(spawn_error));
    }

    out_pipe.CloseWrite();
    err_pipe.CloseWrite();

    ProcessResult result;
    std::string pending_line;
    char buffer[4096];

    while (out_pipe.read_fd >= 0 || err_pipe.read_fd >= 0) {
        if (cancel_flag != nullptr && cancel_flag->load(std::memory_order_relaxed)) {
            kill(-pid, SIGTERM);
            result.cancelled = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_pipe.read_fd >= 0) {
            fds[count++] = pollfd{out_pipe.read_fd, POLLIN, 0};
        }
        if (err_pipe.read_fd >= 0) {
            fds[count++] = pollfd{err_pipe.read_fd, POLLIN, 0};
        }

        const int ready = poll(fds, count, 100);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            kill(-pid, SIGKILL);
            WaitForChild(pid);
            throw std::runtime_error(std::string("Waiting for child output failed: ") + std::strerror(errno));
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const bool is_stdout = fds[i].fd == out_pipe.read_fd;
            const ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                if (is_stdout) {
                    out_pipe.CloseRead();
                } else {
                    err_pipe.CloseRead();
                }
                continue;
            }
            if (is_stdout) {
                result.standard_output.append(buffer, static_cast<std::size_t>(n));
                pending_line.append(buffer, static_cast<std::size_t>(n));
                EmitLines(pending_line, on_stdout_line);
            } else {
                result.standard_error.append(buffer, static_cast<std::size_t>(n));
            }
        }
    }

    out_pipe.CloseRead();
    err_pipe.CloseRead();

    if (!result.cancelled && !pending_line.empty() && on_stdout_line) {
        on_stdout_line(pending_line);
    }

    result.exit_code = WaitForChild(pid);
    return result;
}
