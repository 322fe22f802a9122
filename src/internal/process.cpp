#include "process.hpp"

#include "ccprobe/format.hpp"
#include "ccprobe/utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

using namespace ccprobe::literals;

namespace ccprobe::internal::process {

    namespace detail {

        using clock = std::chrono::steady_clock;

        struct pipe_pair {
            int read_end{-1};
            int write_end{-1};

            bool open(int flags = 0) {
                int fds[2]{};
                if (::pipe2(fds, flags) != 0) {
                    return false;
                }
                read_end = fds[0];
                write_end = fds[1];
                return true;
            }

            static void close_fd(int& fd) {
                if (fd >= 0) {
                    ::close(fd);
                    fd = -1;
                }
            }

            void close_read() { close_fd(read_end); }
            void close_write() { close_fd(write_end); }
            void close_both() {
                close_read();
                close_write();
            }
        };

        static void ignore_sigpipe() {
            static const bool installed = [] {
                ::signal(SIGPIPE, SIG_IGN);
                return true;
            }();
            (void)installed;
        }

        static int remaining_ms(clock::time_point deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            return left > 0 ? static_cast<int>(left) : 0;
        }

        static int decode_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        [[noreturn]] static void exec_child(
                const subprocess_request& request,
                pipe_pair& in,
                pipe_pair& out,
                pipe_pair& err,
                pipe_pair& exec_status) {
            ::setpgid(0, 0);

            ::dup2(in.read_end, STDIN_FILENO);
            ::dup2(out.write_end, STDOUT_FILENO);
            ::dup2(err.write_end, STDERR_FILENO);
            in.close_both();
            out.close_both();
            err.close_both();
            exec_status.close_read();

            if (request.cwd && ::chdir(request.cwd->c_str()) != 0) {
                int code = errno;
                (void)::write(exec_status.write_end, &code, sizeof(code));
                _exit(127);
            }

            std::vector<char*> argv{};
            argv.reserve(request.args.size() + 1);
            for (const auto& arg : request.args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);
            ::execvp(argv[0], argv.data());

            int code = errno;
            (void)::write(exec_status.write_end, &code, sizeof(code));
            _exit(127);
        }

    }  // namespace detail

    std::string render_command(const std::vector<std::string>& args) {
        return utils::join_with_separator(args, " "sv);
    }

    subprocess_result run_subprocess(const subprocess_request& request) {
        if (request.args.empty()) {
            return {.exit_code = 127, .stderr_output = "empty command", .launch_failed = true};
        }
        detail::ignore_sigpipe();

        detail::pipe_pair in{};
        detail::pipe_pair out{};
        detail::pipe_pair err{};
        detail::pipe_pair exec_status{};
        if (!in.open() || !out.open() || !err.open() || !exec_status.open(O_CLOEXEC)) {
            in.close_both();
            out.close_both();
            err.close_both();
            exec_status.close_both();
            return {.exit_code = 1, .stderr_output = "pipe() failed"};
        }

        debug_log("exec: ", render_command(request.args));

        auto pid = ::fork();
        if (pid < 0) {
            in.close_both();
            out.close_both();
            err.close_both();
            exec_status.close_both();
            return {.exit_code = 1, .stderr_output = "fork() failed"};
        }
        if (pid == 0) {
            detail::exec_child(request, in, out, err, exec_status);
        }

        // parent
        in.close_read();
        out.close_write();
        err.close_write();
        exec_status.close_write();

        // the write end is close-on-exec: EOF means exec succeeded, an int means it did not
        int exec_errno = 0;
        ssize_t status_bytes = 0;
        do {
            status_bytes = ::read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
        } while (status_bytes < 0 && errno == EINTR);
        exec_status.close_read();

        if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
            in.close_write();
            out.close_read();
            err.close_read();
            int status = 0;
            ::waitpid(pid, &status, 0);
            return {.exit_code = 127,
                    .stderr_output = "{}: {}"_format(request.args.front(), std::strerror(exec_errno)),
                    .launch_failed = true};
        }

        if (request.stdin_text.empty()) {
            in.close_write();
        }
        else {
            ::fcntl(in.write_end, F_SETFL, ::fcntl(in.write_end, F_GETFL) | O_NONBLOCK);
        }

        std::string out_buf{};
        std::string err_buf{};
        size_t stdin_written = 0U;
        bool timed_out = false;

        auto deadline = detail::clock::now() + std::chrono::milliseconds(request.timeout_ms);

        pollfd fds[3]{};
        fds[0] = {.fd = out.read_end, .events = POLLIN, .revents = 0};
        fds[1] = {.fd = err.read_end, .events = POLLIN, .revents = 0};
        fds[2] = {.fd = in.write_end, .events = POLLOUT, .revents = 0};

        while (fds[0].fd >= 0 || fds[1].fd >= 0) {
            auto remaining = detail::remaining_ms(deadline);
            if (remaining <= 0) {
                timed_out = true;
                break;
            }

            int ret = ::poll(fds, 3, remaining);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                    continue;
                }
                auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                if (n > 0) {
                    (i == 0 ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
                }
                else if (n == 0 || errno != EINTR) {
                    ::close(fds[i].fd);
                    fds[i].fd = -1;
                }
            }

            if (fds[2].fd >= 0 && (fds[2].revents & (POLLOUT | POLLERR | POLLHUP)) != 0) {
                auto pending = std::string_view{request.stdin_text}.substr(stdin_written);
                auto n = ::write(fds[2].fd, pending.data(), pending.size());
                if (n > 0) {
                    stdin_written += static_cast<size_t>(n);
                }
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || stdin_written == request.stdin_text.size()) {
                    ::close(fds[2].fd);
                    fds[2].fd = -1;
                    in.write_end = -1;
                }
            }
        }

        for (auto& pfd : fds) {
            if (pfd.fd >= 0) {
                ::close(pfd.fd);
                pfd.fd = -1;
            }
        }

        // the child may close its streams and keep running
        int status = 0;
        if (!timed_out) {
            while (true) {
                auto reaped = ::waitpid(pid, &status, WNOHANG);
                if (reaped == pid || (reaped < 0 && errno != EINTR)) {
                    break;
                }
                if (detail::remaining_ms(deadline) <= 0) {
                    timed_out = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{2});
            }
        }

        if (timed_out) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            debug_log("timed out after ", request.timeout_ms, "ms: ", request.args.front());
            return {.exit_code = 1,
                    .stdout_output = std::move(out_buf),
                    .stderr_output = "subprocess timed out",
                    .timed_out = true};
        }

        return {.exit_code = detail::decode_status(status),
                .stdout_output = std::move(out_buf),
                .stderr_output = std::move(err_buf)};
    }

}  // namespace ccprobe::internal::process
