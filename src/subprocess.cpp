#include "subprocess.hpp"
#include <array>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace karltui {

namespace {

std::vector<char*> make_argv(const std::vector<std::string>& args) {
    std::vector<char*> out;
    out.reserve(args.size() + 1);
    for (const auto& a : args) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

int wait_exit_code(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

ProcessResult run_capture(const std::vector<std::string>& argv) {
    ProcessResult result;
    if (argv.empty()) return result;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) return result;
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    auto args = make_argv(argv);
    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: no stdin, output to the pipes
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        close(out_pipe[0]);
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        close(err_pipe[1]);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    result.spawned = true;

    std::array<struct pollfd, 2> fds{};
    fds[0] = {out_pipe[0], POLLIN, 0};
    fds[1] = {err_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.out, &result.err};
    std::array<char, 4096> buffer;

    int open_fds = 2;
    while (open_fds > 0) {
        int ret = poll(fds.data(), fds.size(), -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            // EOF or error
            close(fds[i].fd);
            fds[i].fd = -1;
            --open_fds;
        }
    }
    for (auto& pfd : fds) {
        if (pfd.fd >= 0) close(pfd.fd);
    }

    result.exit_code = wait_exit_code(pid);
    return result;
}

bool run_interactive(const std::vector<std::string>& argv) {
    if (argv.empty()) return false;
    auto args = make_argv(argv);
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid == 0) {
        execvp(args[0], args.data());
        _exit(127);
    }
    return wait_exit_code(pid) == 0;
}

} // namespace karltui
