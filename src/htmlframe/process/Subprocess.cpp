#include "process/Subprocess.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ranges>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace HF::Process {

namespace {

// Owns a pair of pipe descriptors and closes whatever is still open.
class Pipe {
public:
    Pipe() = default;
    Pipe(Pipe const&)            = delete;
    Pipe& operator=(Pipe const&) = delete;
    ~Pipe() {
        close_read();
        close_write();
    }

    auto open(bool cloexec) -> bool {
        if (::pipe(fds_.data()) != 0) {
            return false;
        }
        if (cloexec) {
            ::fcntl(fds_[0], F_SETFD, FD_CLOEXEC);
            ::fcntl(fds_[1], F_SETFD, FD_CLOEXEC);
        }
        return true;
    }

    auto read_end() const -> int { return fds_[0]; }
    auto write_end() const -> int { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    std::array<int, 2> fds_{-1, -1};
};

auto errno_message(int error) -> std::string {
    return std::error_code(error, std::generic_category()).message();
}

auto set_non_blocking(int fd) -> void {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Reads what is available. Returns false once the descriptor reached EOF.
auto drain(int fd, std::string& sink) -> bool {
    std::array<char, 4096> buffer{};
    while (true) {
        auto count = ::read(fd, buffer.data(), buffer.size());
        if (count > 0) {
            sink.append(buffer.data(), static_cast<std::size_t>(count));
            continue;
        }
        if (count == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

auto wait_blocking(pid_t pid, int& status) -> void {
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

} // namespace

auto IsExecutableFile(std::filesystem::path const& path) -> bool {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

auto FindExecutableInPath(std::string_view name) -> std::optional<std::filesystem::path> {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path direct{std::string{name}};
        if (IsExecutableFile(direct)) {
            return direct;
        }
        return std::nullopt;
    }
    char const* raw = std::getenv("PATH");
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string_view search{raw};
    for (auto part : search | std::views::split(':')) {
        std::string_view directory{part.begin(), part.end()};
        if (directory.empty()) {
            continue;
        }
        auto candidate = std::filesystem::path{std::string{directory}} / std::string{name};
        if (IsExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto RunProcess(std::vector<std::string> const& argv, ProcessOptions const& options) -> Expected<ProcessResult> {
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "empty command line"});
    }

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe exec_status;
    if (!out_pipe.open(false) || !err_pipe.open(false) || !exec_status.open(true)) {
        return std::unexpected(Error{Error::Code::SpawnFailed, "pipe: " + errno_message(errno)});
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto const& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    std::string const working_directory = options.working_directory ? options.working_directory->string() : std::string{};

    hf_log("spawning " + argv.front(), "Subprocess");
    pid_t child = ::fork();
    if (child == -1) {
        return std::unexpected(Error{Error::Code::SpawnFailed, "fork: " + errno_message(errno)});
    }
    if (child == 0) {
        ::dup2(out_pipe.write_end(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end(), STDERR_FILENO);
        ::close(out_pipe.read_end());
        ::close(err_pipe.read_end());
        ::close(exec_status.read_end());
        if (!working_directory.empty() && ::chdir(working_directory.c_str()) != 0) {
            int error = errno;
            (void)!::write(exec_status.write_end(), &error, sizeof(error));
            ::_exit(127);
        }
        ::execvp(args.front(), args.data());
        int error = errno;
        (void)!::write(exec_status.write_end(), &error, sizeof(error));
        ::_exit(127);
    }

    out_pipe.close_write();
    err_pipe.close_write();
    exec_status.close_write();

    int  exec_error = 0;
    auto got        = ssize_t{0};
    do {
        got = ::read(exec_status.read_end(), &exec_error, sizeof(exec_error));
    } while (got == -1 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(exec_error))) {
        int status = 0;
        wait_blocking(child, status);
        if (exec_error == ENOENT) {
            return std::unexpected(Error{Error::Code::NotFound, "executable not found: " + argv.front()});
        }
        return std::unexpected(Error{Error::Code::SpawnFailed,
                                     "failed to start " + argv.front() + ": " + errno_message(exec_error)});
    }

    set_non_blocking(out_pipe.read_end());
    set_non_blocking(err_pipe.read_end());

    ProcessResult result{};
    bool          out_open = true;
    bool          err_open = true;
    bool          exited   = false;
    int           status   = 0;
    auto const    deadline = std::chrono::steady_clock::now() + options.timeout;

    while (true) {
        if (!exited) {
            pid_t waited = ::waitpid(child, &status, WNOHANG);
            if (waited == child) {
                exited = true;
            }
        }
        if (exited) {
            // Grandchildren may keep the pipes open; only take what is buffered.
            if (out_open) {
                drain(out_pipe.read_end(), result.stdout_text);
            }
            if (err_open) {
                drain(err_pipe.read_end(), result.stderr_text);
            }
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            ::kill(child, SIGKILL);
            wait_blocking(child, status);
            return std::unexpected(Error{Error::Code::Timeout,
                                         argv.front() + " timed out after "
                                             + std::to_string(options.timeout.count()) + " ms"});
        }

        std::array<pollfd, 2> fds{};
        nfds_t                count = 0;
        if (out_open) {
            fds[count++] = pollfd{out_pipe.read_end(), POLLIN, 0};
        }
        if (err_open) {
            fds[count++] = pollfd{err_pipe.read_end(), POLLIN, 0};
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int  wait_ms   = static_cast<int>(std::min<long long>(remaining, 50));
        if (::poll(fds.data(), count, wait_ms) > 0) {
            if (out_open) {
                out_open = drain(out_pipe.read_end(), result.stdout_text);
            }
            if (err_open) {
                err_open = drain(err_pipe.read_end(), result.stderr_text);
            }
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code   = 128 + result.term_signal;
    }
    return result;
}

} // namespace HF::Process
