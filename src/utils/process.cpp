#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gitstack::utils {

namespace {

void closePipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

// Hands errno to the parent through the status pipe.
[[noreturn]] void failChild(int statusFd) {
    const int err = errno;
    while (::write(statusFd, &err, sizeof(err)) < 0 && errno == EINTR) {}
    _exit(127);
}

[[noreturn]] void execChild(const std::vector<std::string>& argv, const std::string& workDir,
                            int statusFd) {
    if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) {
        failChild(statusFd);
    }
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(nullptr);
    ::execvp(args[0], args.data());
    failChild(statusFd);
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Fork and exec `argv`. The child's stdout and stderr go to the write ends of
// `outPipe` and `errPipe` when given. The status pipe is closed by a
// successful exec, so anything read from it is the errno of a failed start.
pid_t spawn(const std::vector<std::string>& argv, const std::string& workDir,
            int* outPipe, int* errPipe) {
    int statusPipe[2] = {-1, -1};
    if (::pipe(statusPipe) != 0 || ::fcntl(statusPipe[1], F_SETFD, FD_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        closePipe(statusPipe);
        throw std::runtime_error("pipe failed: " + reason);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        closePipe(statusPipe);
        throw std::runtime_error("fork failed: " + reason);
    }
    if (pid == 0) {
        ::close(statusPipe[0]);
        if (outPipe && errPipe) {
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            closePipe(outPipe);
            closePipe(errPipe);
        }
        execChild(argv, workDir, statusPipe[1]);
    }

    ::close(statusPipe[1]);
    int childErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        waitForChild(pid);
        throw std::runtime_error("Could not start '" + argv[0] + "': " + std::strerror(childErrno));
    }
    return pid;
}

}

ProcessResult runProcess(const std::vector<std::string>& argv,
                         const std::string& workDir,
                         bool passthrough) {
    if (argv.empty()) {
        throw std::runtime_error("runProcess: empty command");
    }

    ProcessResult result;

    if (passthrough) {
        result.exitCode = waitForChild(spawn(argv, workDir, nullptr, nullptr));
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe(outPipe) != 0 || ::pipe(errPipe) != 0) {
        const std::string reason = std::strerror(errno);
        closePipe(outPipe);
        closePipe(errPipe);
        throw std::runtime_error("pipe failed: " + reason);
    }

    pid_t pid = -1;
    try {
        pid = spawn(argv, workDir, outPipe, errPipe);
    } catch (const std::runtime_error&) {
        closePipe(outPipe);
        closePipe(errPipe);
        throw;
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);

    // Drain both pipes together so a chatty stderr cannot stall the child.
    int fds[2] = {outPipe[0], errPipe[0]};
    std::string* sinks[2] = {&result.output, &result.errorOutput};
    int openCount = 2;
    char buf[4096];

    while (openCount > 0) {
        pollfd pfds[2] = {{fds[0], POLLIN, 0}, {fds[1], POLLIN, 0}};
        if (::poll(pfds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0 || !(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = ::read(fds[i], buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i]);
                fds[i] = -1;
                --openCount;
            }
        }
    }

    for (int fd : fds) if (fd >= 0) ::close(fd);

    result.exitCode = waitForChild(pid);
    return result;
}

std::string trimOutput(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

}
