#include "sigchain/process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sigchain
{

    namespace
    {
        class FileDescriptor
        {
        public:
            FileDescriptor() = default;
            explicit FileDescriptor(int fd) : fd_(fd) {}
            ~FileDescriptor() { reset(); }

            FileDescriptor(const FileDescriptor &) = delete;
            FileDescriptor &operator=(const FileDescriptor &) = delete;

            FileDescriptor(FileDescriptor &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
            FileDescriptor &operator=(FileDescriptor &&other) noexcept
            {
                if (this != &other)
                {
                    reset();
                    fd_ = std::exchange(other.fd_, -1);
                }
                return *this;
            }

            int get() const { return fd_; }
            bool is_open() const { return fd_ >= 0; }

            void reset()
            {
                if (fd_ >= 0)
                    ::close(fd_);
                fd_ = -1;
            }

        private:
            int fd_{-1};
        };

        struct Pipe
        {
            FileDescriptor read_end;
            FileDescriptor write_end;
        };

        std::string errno_message(int err)
        {
            return std::string(std::strerror(err));
        }

        Result<Pipe> make_pipe()
        {
            int fds[2];
            if (::pipe2(fds, O_CLOEXEC) != 0)
            {
                return std::unexpected(SigchainError::process("pipe() failed: " + errno_message(errno)));
            }
            return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
        }

        // A child that exits before reading all of its stdin must not kill us.
        void ignore_sigpipe()
        {
            static std::once_flag once;
            std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
        }

        Result<int> wait_for(pid_t pid, const std::string &what)
        {
            int status = 0;
            while (::waitpid(pid, &status, 0) == -1)
            {
                if (errno != EINTR)
                    return std::unexpected(SigchainError::process("waitpid failed for " + what + ": " + errno_message(errno)));
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            if (WIFSIGNALED(status))
                return std::unexpected(SigchainError::process(
                    std::format("{} killed by signal {}", what, WTERMSIG(status))));
            return std::unexpected(SigchainError::process(what + " terminated abnormally"));
        }

        // Shuttle stdin/stdout/stderr until all three are closed.
        Result<void> pump(FileDescriptor &in, std::string_view input,
                          FileDescriptor &out, std::string &out_buf,
                          FileDescriptor &err, std::string &err_buf)
        {
            std::size_t written = 0;
            char buffer[65536];

            if (in.is_open() && input.empty())
                in.reset();
            if (in.is_open())
                ::fcntl(in.get(), F_SETFL, ::fcntl(in.get(), F_GETFL) | O_NONBLOCK);

            while (in.is_open() || out.is_open() || err.is_open())
            {
                pollfd fds[3];
                nfds_t count = 0;
                int in_idx = -1, out_idx = -1, err_idx = -1;
                if (in.is_open())
                {
                    in_idx = static_cast<int>(count);
                    fds[count++] = pollfd{in.get(), POLLOUT, 0};
                }
                if (out.is_open())
                {
                    out_idx = static_cast<int>(count);
                    fds[count++] = pollfd{out.get(), POLLIN, 0};
                }
                if (err.is_open())
                {
                    err_idx = static_cast<int>(count);
                    fds[count++] = pollfd{err.get(), POLLIN, 0};
                }

                if (::poll(fds, count, -1) < 0)
                {
                    if (errno == EINTR)
                        continue;
                    return std::unexpected(SigchainError::process("poll failed: " + errno_message(errno)));
                }

                if (in_idx >= 0 && fds[in_idx].revents != 0)
                {
                    auto n = ::write(in.get(), input.data() + written, input.size() - written);
                    if (n > 0)
                    {
                        written += static_cast<std::size_t>(n);
                        if (written == input.size())
                            in.reset();
                    }
                    else if (n < 0 && errno != EAGAIN && errno != EINTR)
                    {
                        // EPIPE: the child stopped reading; its exit status tells the rest.
                        in.reset();
                    }
                }

                auto drain = [&](int idx, FileDescriptor &fd, std::string &buf) -> Result<void> {
                    if (idx < 0 || fds[idx].revents == 0)
                        return {};
                    auto n = ::read(fd.get(), buffer, sizeof(buffer));
                    if (n > 0)
                        buf.append(buffer, static_cast<std::size_t>(n));
                    else if (n == 0)
                        fd.reset();
                    else if (errno != EAGAIN && errno != EINTR)
                        return std::unexpected(SigchainError::process("read from child failed: " + errno_message(errno)));
                    return {};
                };

                if (auto res = drain(out_idx, out, out_buf); !res)
                    return res;
                if (auto res = drain(err_idx, err, err_buf); !res)
                    return res;
            }
            return {};
        }
    } // namespace

    std::string describe_command(const std::vector<std::string> &argv)
    {
        std::string out;
        for (const auto &arg : argv)
        {
            if (!out.empty())
                out += ' ';
            out += arg;
        }
        return out;
    }

    Result<ProcessResult> run_process(const ProcessSpec &spec)
    {
        if (spec.argv.empty())
            return std::unexpected(SigchainError::internal("run_process called with empty argv"));

        ignore_sigpipe();

        // execvp wants a NULL terminated char* array; build it before forking.
        std::vector<char *> argv;
        argv.reserve(spec.argv.size() + 1);
        for (const auto &arg : spec.argv)
            argv.push_back(const_cast<char *>(arg.c_str()));
        argv.push_back(nullptr);

        std::string cwd = spec.cwd ? spec.cwd->string() : std::string();

        auto stdin_pipe = make_pipe();
        if (!stdin_pipe)
            return std::unexpected(stdin_pipe.error());
        auto stdout_pipe = make_pipe();
        if (!stdout_pipe)
            return std::unexpected(stdout_pipe.error());
        auto stderr_pipe = make_pipe();
        if (!stderr_pipe)
            return std::unexpected(stderr_pipe.error());
        auto exec_pipe = make_pipe();
        if (!exec_pipe)
            return std::unexpected(exec_pipe.error());

        pid_t pid = ::fork();
        if (pid < 0)
        {
            return std::unexpected(SigchainError::process("fork failed: " + errno_message(errno)));
        }

        if (pid == 0)
        {
            // we are in the child process; only async-signal-safe calls from here on
            ::dup2(stdin_pipe->read_end.get(), STDIN_FILENO);
            ::dup2(stdout_pipe->write_end.get(), STDOUT_FILENO);
            ::dup2(stderr_pipe->write_end.get(), STDERR_FILENO);
            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
            {
                int e = errno;
                (void)!::write(exec_pipe->write_end.get(), &e, sizeof(e));
                ::_exit(127);
            }
            ::execvp(argv[0], argv.data());
            int e = errno;
            (void)!::write(exec_pipe->write_end.get(), &e, sizeof(e));
            ::_exit(127);
        }

        // we are in the parent process
        stdin_pipe->read_end.reset();
        stdout_pipe->write_end.reset();
        stderr_pipe->write_end.reset();
        exec_pipe->write_end.reset();

        const std::string what = spec.argv.front();

        int exec_errno = 0;
        ssize_t got = 0;
        do
        {
            got = ::read(exec_pipe->read_end.get(), &exec_errno, sizeof(exec_errno));
        } while (got < 0 && errno == EINTR);
        if (got == static_cast<ssize_t>(sizeof(exec_errno)))
        {
            auto _ = wait_for(pid, what);
            return std::unexpected(SigchainError::process(
                std::format("cannot execute {}: {}", what, errno_message(exec_errno))));
        }

        ProcessResult result;
        auto pumped = pump(stdin_pipe->write_end, spec.input.value_or(std::string()),
                           stdout_pipe->read_end, result.out,
                           stderr_pipe->read_end, result.err);

        auto status = wait_for(pid, what);
        if (!pumped)
            return std::unexpected(pumped.error());
        if (!status)
            return std::unexpected(status.error());

        result.exit_code = *status;
        return result;
    }

} // namespace sigchain
