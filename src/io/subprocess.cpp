// =============================================================================
// wfgen - Subprocess Execution Implementation
// =============================================================================

#include "wfg/io/subprocess.h"

#include <array>
#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "wfg/common/error.h"
#include "wfg/common/logger.h"

extern char** environ;

namespace wfg::io {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

/// @brief Owning file descriptor.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

/// @brief Pipe whose ends are close-on-exec in the parent.
struct Pipe {
    FileDescriptor readEnd;
    FileDescriptor writeEnd;
};

[[nodiscard]] std::error_code lastError() noexcept {
    return {errno, std::generic_category()};
}

Pipe makePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw IOError("Failed to create pipe", lastError());
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

/// @brief RAII owner of posix_spawn file actions.
class SpawnFileActions {
public:
    SpawnFileActions() {
        if (int rc = ::posix_spawn_file_actions_init(&actions_); rc != 0) {
            throw IOError("Failed to initialize spawn file actions",
                          std::error_code(rc, std::generic_category()));
        }
    }

    ~SpawnFileActions() { ::posix_spawn_file_actions_destroy(&actions_); }

    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;

    void addDup2(int fd, int target) {
        if (int rc = ::posix_spawn_file_actions_adddup2(&actions_, fd, target); rc != 0) {
            throw IOError("Failed to configure child descriptor",
                          std::error_code(rc, std::generic_category()));
        }
    }

    void addOpen(int target, const char* path, int flags) {
        if (int rc = ::posix_spawn_file_actions_addopen(&actions_, target, path, flags, 0);
            rc != 0) {
            throw IOError("Failed to configure child descriptor",
                          std::error_code(rc, std::generic_category()));
        }
    }

    [[nodiscard]] const posix_spawn_file_actions_t* get() const noexcept { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

/// @brief Read once from fd, appending to out.
/// @return false when the pipe reached end of file.
template <typename Buffer>
bool drainOnce(int fd, Buffer& out, std::array<char, kReadChunk>& scratch) {
    for (;;) {
        ssize_t n = ::read(fd, scratch.data(), scratch.size());
        if (n > 0) {
            out.insert(out.end(), scratch.data(), scratch.data() + n);
            return true;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        throw IOError("Failed to read child output", lastError());
    }
}

int waitForChild(pid_t pid, ProcessResult& result) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw IOError("Failed to wait for child process", lastError());
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.termSignal = 0;
    } else if (WIFSIGNALED(status)) {
        result.exitCode = -1;
        result.termSignal = WTERMSIG(status);
    }
    return status;
}

}  // namespace

std::string formatCommandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line.push_back(' ');
        }
        if (arg.find(' ') != std::string::npos) {
            line.push_back('"');
            line += arg;
            line.push_back('"');
        } else {
            line += arg;
        }
    }
    return line;
}

ProcessResult runProcess(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        throw UsageError("Cannot run a process without a program name");
    }

    Pipe outPipe = makePipe();
    Pipe errPipe = makePipe();

    SpawnFileActions actions;
    actions.addOpen(STDIN_FILENO, "/dev/null", O_RDONLY);
    actions.addDup2(outPipe.writeEnd.get(), STDOUT_FILENO);
    actions.addDup2(errPipe.writeEnd.get(), STDERR_FILENO);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    WFG_LOG_DEBUG("Spawning: {}", formatCommandLine(argv));

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, args[0], actions.get(), nullptr, args.data(), environ);
    if (rc != 0) {
        throw IOError("Failed to start '" + argv.front() + "'",
                      std::error_code(rc, std::generic_category()));
    }

    // Parent keeps only the read ends; EOF arrives once the child exits.
    outPipe.writeEnd.reset();
    errPipe.writeEnd.reset();

    ProcessResult result;
    std::array<char, kReadChunk> scratch{};
    std::string stderrAll;

    try {
        bool outOpen = true;
        bool errOpen = true;
        while (outOpen || errOpen) {
            std::array<pollfd, 2> fds{};
            fds[0] = {outOpen ? outPipe.readEnd.get() : -1, POLLIN, 0};
            fds[1] = {errOpen ? errPipe.readEnd.get() : -1, POLLIN, 0};

            if (::poll(fds.data(), fds.size(), -1) < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw IOError("Failed to poll child output", lastError());
            }

            if (outOpen && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                outOpen = drainOnce(outPipe.readEnd.get(), result.stdoutData, scratch);
            }
            if (errOpen && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                errOpen = drainOnce(errPipe.readEnd.get(), stderrAll, scratch);
                if (stderrAll.size() > 2 * kMaxCapturedStderr) {
                    stderrAll.erase(0, stderrAll.size() - kMaxCapturedStderr);
                }
            }
        }
    } catch (...) {
        // Reap the child before propagating so no zombie is left behind.
        ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw;
    }

    waitForChild(pid, result);

    if (stderrAll.size() > kMaxCapturedStderr) {
        stderrAll.erase(0, stderrAll.size() - kMaxCapturedStderr);
    }
    result.stderrText = std::move(stderrAll);

    WFG_LOG_DEBUG("'{}' finished: exit={}, signal={}, stdout={} bytes", argv.front(),
                  result.exitCode, result.termSignal, result.stdoutData.size());

    return result;
}

}  // namespace wfg::io
