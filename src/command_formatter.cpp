#include "command_formatter.hpp"
#include "errors.hpp"
#include "verbose.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace marker {

namespace {
    // Owns a file descriptor and closes it on destruction.
    class UniqueFd {
    public:
        UniqueFd() : fd_(-1) {}
        explicit UniqueFd(int fd) : fd_(fd) {}
        UniqueFd(const UniqueFd&) = delete;
        UniqueFd& operator=(const UniqueFd&) = delete;
        UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
        UniqueFd& operator=(UniqueFd&& other) noexcept {
            if (this != &other) {
                reset(other.fd_);
                other.fd_ = -1;
            }
            return *this;
        }
        ~UniqueFd() { reset(); }

        int get() const { return fd_; }
        bool valid() const { return fd_ >= 0; }
        void reset(int fd = -1) {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            fd_ = fd;
        }

    private:
        int fd_;
    };

    struct Pipe {
        UniqueFd read_end;
        UniqueFd write_end;
    };

    Pipe make_pipe() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw FormatError(std::string("pipe failed: ") + std::strerror(errno));
        }
        return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
    }

    // Blocks SIGPIPE for the calling thread while in scope, so a formatter
    // that exits without reading its input surfaces as EPIPE. A SIGPIPE
    // raised meanwhile is consumed before the old mask is restored.
    class SigpipeBlocker {
    public:
        SigpipeBlocker() {
            sigset_t block;
            sigemptyset(&block);
            sigaddset(&block, SIGPIPE);
            pthread_sigmask(SIG_BLOCK, &block, &old_mask_);
        }
        ~SigpipeBlocker() {
            sigset_t pending;
            sigemptyset(&pending);
            if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) &&
                !sigismember(&old_mask_, SIGPIPE)) {
                sigset_t pipe_only;
                sigemptyset(&pipe_only);
                sigaddset(&pipe_only, SIGPIPE);
                struct timespec zero = {0, 0};
                sigtimedwait(&pipe_only, nullptr, &zero);
            }
            pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
        }

    private:
        sigset_t old_mask_;
    };

    std::string join_command(const std::vector<std::string>& command) {
        std::string joined;
        for (size_t i = 0; i < command.size(); ++i) {
            if (i > 0) joined += ' ';
            joined += command[i];
        }
        return joined;
    }

    // Reads whatever is available on fd into out. Closes fd at end of stream.
    void drain(UniqueFd& fd, std::string& out) {
        char buffer[4096];
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            fd.reset();
        } else if (errno != EINTR && errno != EAGAIN) {
            throw FormatError(std::string("read from formatter failed: ") + std::strerror(errno));
        }
    }
}

CommandFormatter::CommandFormatter(std::vector<std::string> command)
    : command_(std::move(command))
{
}

std::string CommandFormatter::format(const std::string& code) {
    if (command_.empty()) {
        throw FormatError("code formatter has an empty command");
    }

    const std::string name = join_command(command_);
    verbose_log("format", "running '" + name + "' on " + std::to_string(code.size()) + " bytes");

    SigpipeBlocker sigpipe_blocker;

    Pipe in = make_pipe();
    Pipe out = make_pipe();
    Pipe err = make_pipe();

    std::vector<char*> argv;
    for (const auto& arg : command_) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw FormatError("fork failed for '" + name + "': " + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: wire the pipes to stdio and exec. Only async-signal-safe
        // calls from here on.
        if (::dup2(in.read_end.get(), STDIN_FILENO) < 0 ||
            ::dup2(out.write_end.get(), STDOUT_FILENO) < 0 ||
            ::dup2(err.write_end.get(), STDERR_FILENO) < 0) {
            ::_exit(127);
        }
        sigset_t none;
        sigemptyset(&none);
        pthread_sigmask(SIG_SETMASK, &none, nullptr);
        ::execvp(argv[0], argv.data());
        const char* message = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, message, std::strlen(message));
        (void)ignored;
        ::_exit(127);
    }

    in.read_end.reset();
    out.write_end.reset();
    err.write_end.reset();

    UniqueFd& to_child = in.write_end;
    UniqueFd& from_child = out.read_end;
    UniqueFd& errors_from_child = err.read_end;

    std::string output;
    std::string errors;
    size_t written = 0;

    if (code.empty()) {
        to_child.reset();
    } else {
        ::fcntl(to_child.get(), F_SETFL, ::fcntl(to_child.get(), F_GETFL) | O_NONBLOCK);
    }

    try {
        while (to_child.valid() || from_child.valid() || errors_from_child.valid()) {
            std::vector<pollfd> fds;
            if (to_child.valid()) fds.push_back({to_child.get(), POLLOUT, 0});
            if (from_child.valid()) fds.push_back({from_child.get(), POLLIN, 0});
            if (errors_from_child.valid()) fds.push_back({errors_from_child.get(), POLLIN, 0});

            if (::poll(fds.data(), fds.size(), -1) < 0) {
                if (errno == EINTR) continue;
                throw FormatError(std::string("poll failed: ") + std::strerror(errno));
            }

            for (const pollfd& p : fds) {
                if (p.revents == 0) {
                    continue;
                }
                if (to_child.valid() && p.fd == to_child.get()) {
                    ssize_t n = ::write(p.fd, code.data() + written, code.size() - written);
                    if (n > 0) {
                        written += static_cast<size_t>(n);
                        if (written == code.size()) {
                            to_child.reset();
                        }
                    } else if (n < 0 && errno == EPIPE) {
                        // The formatter stopped reading; its exit status decides.
                        to_child.reset();
                    } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                        throw FormatError(std::string("write to formatter failed: ") + std::strerror(errno));
                    }
                } else if (from_child.valid() && p.fd == from_child.get()) {
                    drain(from_child, output);
                } else if (errors_from_child.valid() && p.fd == errors_from_child.get()) {
                    drain(errors_from_child, errors);
                }
            }
        }
    } catch (const FormatError&) {
        ::kill(pid, SIGKILL);
        int ignored_status = 0;
        ::waitpid(pid, &ignored_status, 0);
        throw;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw FormatError("waitpid failed for '" + name + "': " + std::strerror(errno));
        }
    }

    if (WIFSIGNALED(status)) {
        std::string message = "'" + name + "' killed by signal " + std::to_string(WTERMSIG(status));
        verbose_err("format", message);
        throw FormatError(message);
    }
    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code != 0) {
        std::string message = "'" + name + "' exited with status " + std::to_string(exit_code);
        if (!errors.empty()) {
            message += ": " + truncate(errors, 2000);
            while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
                message.pop_back();
            }
        }
        verbose_err("format", message);
        throw FormatError(message);
    }

    verbose_log("format", "'" + name + "' produced " + std::to_string(output.size()) + " bytes");
    return output;
}

} // namespace marker
