#include "process_runner.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rpcprobe::transport {

namespace {

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read;
    FileDescriptor write;
};

bool open_pipe(Pipe& pipe, std::string& error) {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        return false;
    }
    pipe.read.reset(fds[0]);
    pipe.write.reset(fds[1]);
    return true;
}

void set_nonblocking(const FileDescriptor& fd) {
    if (!fd.valid()) {
        return;
    }
    int flags = ::fcntl(fd.get(), F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK);
    }
}

/// Owns a forked child that leads its own process group. Anything of the group still
/// running on destruction is killed, and the child is reaped.
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    ~ChildProcess() {
        kill();
        wait();
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int exit_code() const { return exit_code_; }

    // Signals the whole group: descendants may outlive the child and hold its pipes.
    void kill() {
        if (::kill(-pid_, SIGKILL) != 0 && !reaped_) {
            ::kill(pid_, SIGKILL);
        }
    }

    bool try_reap() {
        if (reaped_) {
            return true;
        }
        int status = 0;
        pid_t rc = ::waitpid(pid_, &status, WNOHANG);
        if (rc == pid_) {
            record(status);
        } else if (rc < 0 && errno != EINTR) {
            reaped_ = true;
        }
        return reaped_;
    }

    void wait() {
        while (!reaped_) {
            int status = 0;
            pid_t rc = ::waitpid(pid_, &status, 0);
            if (rc == pid_) {
                record(status);
            } else if (rc < 0 && errno != EINTR) {
                reaped_ = true;
            }
        }
    }

private:
    void record(int status) {
        reaped_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
    }

    pid_t pid_;
    bool reaped_ = false;
    int exit_code_ = -1;
};

// With SIGPIPE ignored a child that exits before reading stdin shows up as EPIPE.
void ignore_sigpipe() {
    static const bool ignored = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)ignored;
}

// Runs between fork and exec: async-signal-safe calls only.
bool redirect(int fd, int target) {
    if (fd == target) {
        int flags = ::fcntl(fd, F_GETFD);
        return flags >= 0 && ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) == 0;
    }
    return ::dup2(fd, target) == target;
}

[[noreturn]] void exec_child(char* const* argv, const Pipe& in, const Pipe& out, const Pipe& err,
                             const Pipe& exec_status) {
    ::signal(SIGPIPE, SIG_DFL);

    int exec_errno = 0;
    if (::setpgid(0, 0) == 0 &&
        redirect(in.read.get(), STDIN_FILENO) &&
        redirect(out.write.get(), STDOUT_FILENO) &&
        redirect(err.write.get(), STDERR_FILENO)) {
        ::execv(argv[0], argv);
    }
    exec_errno = errno;

    ssize_t ignored = ::write(exec_status.write.get(), &exec_errno, sizeof(exec_errno));
    (void)ignored;
    ::_exit(127);
}

// Reads whatever is available without blocking; closes fd on EOF or error.
// Bytes past kMaxCapturedBytes are read and dropped so the child never blocks on a full pipe.
void drain(FileDescriptor& fd, std::string& sink) {
    char buffer[4096];
    while (fd.valid()) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            if (sink.size() < kMaxCapturedBytes) {
                sink.append(buffer, std::min(static_cast<size_t>(n), kMaxCapturedBytes - sink.size()));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        fd.reset();
    }
}

// Pushes as much pending stdin as the pipe accepts; closes it once done or broken.
void feed(FileDescriptor& fd, const std::string& data, size_t& written) {
    while (fd.valid() && written < data.size()) {
        ssize_t n = ::write(fd.get(), data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        LOG4CPLUS_DEBUG(transport_logger(), "stdin closed by child: " << std::strerror(errno));
        fd.reset();
    }
    fd.reset();
}

} // namespace

const char* to_string(ExchangeStatus status) {
    switch (status) {
        case ExchangeStatus::completed:
            return "completed";
        case ExchangeStatus::timed_out:
            return "timed-out";
        case ExchangeStatus::spawn_failed:
            return "spawn-failed";
    }
    return "unknown";
}

RawOutput run_process(const std::vector<std::string>& argv,
                      const std::string& stdin_data,
                      std::chrono::milliseconds timeout) {
    RawOutput result;
    if (argv.empty()) {
        result.detail = "empty command line";
        return result;
    }

    ignore_sigpipe();

    Pipe in;
    Pipe out;
    Pipe err;
    Pipe exec_status;
    if (!open_pipe(in, result.detail) || !open_pipe(out, result.detail) ||
        !open_pipe(err, result.detail) || !open_pipe(exec_status, result.detail)) {
        LOG4CPLUS_ERROR(transport_logger(), "Cannot start " << argv[0] << ": " << result.detail);
        return result;
    }

    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.detail = std::string("fork: ") + std::strerror(errno);
        LOG4CPLUS_ERROR(transport_logger(), "Cannot start " << argv[0] << ": " << result.detail);
        return result;
    }
    if (pid == 0) {
        exec_child(child_argv.data(), in, out, err, exec_status);
    }

    ChildProcess child(pid);
    in.read.reset();
    out.write.reset();
    err.write.reset();
    exec_status.write.reset();

    // The status pipe is close-on-exec: EOF means execv succeeded.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_status.read.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    exec_status.read.reset();

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        child.wait();
        result.status = ExchangeStatus::spawn_failed;
        result.exit_code = child.exit_code();
        result.detail = std::strerror(exec_errno);
        LOG4CPLUS_ERROR(transport_logger(), "Failed to execute " << argv[0] << ": " << result.detail);
        return result;
    }

    LOG4CPLUS_DEBUG(transport_logger(), "Spawned " << argv[0] << " pid=" << child.pid());

    size_t written = 0;
    if (stdin_data.empty()) {
        in.write.reset();
    }
    set_nonblocking(in.write);
    set_nonblocking(out.read);
    set_nonblocking(err.read);

    bool timed_out = false;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out.read.valid() || err.read.valid() || !child.try_reap()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const auto slice = std::min(remaining, std::chrono::milliseconds(50));

        if (!out.read.valid() && !err.read.valid()) {
            // Streams are closed but the child has not exited yet.
            in.write.reset();
            std::this_thread::sleep_for(std::min(slice, std::chrono::milliseconds(10)));
            continue;
        }

        pollfd fds[3];
        nfds_t count = 0;
        for (const FileDescriptor* fd : {&out.read, &err.read}) {
            if (fd->valid()) {
                fds[count++] = pollfd{fd->get(), POLLIN, 0};
            }
        }
        if (in.write.valid()) {
            fds[count++] = pollfd{in.write.get(), POLLOUT, 0};
        }

        if (::poll(fds, count, static_cast<int>(slice.count())) < 0 && errno != EINTR) {
            LOG4CPLUS_WARN(transport_logger(), "poll failed: " << std::strerror(errno));
            std::this_thread::sleep_for(slice);
        }

        feed(in.write, stdin_data, written);
        drain(out.read, result.out);
        drain(err.read, result.err);
    }

    if (timed_out) {
        LOG4CPLUS_WARN(transport_logger(), "Killing " << argv[0] << " pid=" << child.pid() << " after "
                                                      << timeout.count() << " ms");
        child.kill();
        // Collect what was already written before the kill.
        drain(out.read, result.out);
        drain(err.read, result.err);
    }
    child.wait();

    result.exit_code = child.exit_code();
    if (timed_out) {
        result.status = ExchangeStatus::timed_out;
        result.detail = "no exit within " + std::to_string(timeout.count()) + " ms";
    } else {
        result.status = ExchangeStatus::completed;
        result.detail = "exited with status " + std::to_string(result.exit_code);
    }

    LOG4CPLUS_DEBUG(transport_logger(), argv[0] << " pid=" << child.pid() << " " << to_string(result.status)
                                                << ", exit=" << result.exit_code << ", stdout="
                                                << result.out.size() << "B, stderr=" << result.err.size() << "B");
    return result;
}

RawOutput exchange(const std::string& executable,
                   const std::string& request_line,
                   std::chrono::milliseconds timeout) {
    std::string line = request_line;
    if (line.empty() || line.back() != '\n') {
        line.push_back('\n');
    }
    return run_process({executable}, line, timeout);
}

} // namespace rpcprobe::transport
