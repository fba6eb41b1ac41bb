#include "infrastructure/ProcessRunner.hpp"
#include "domain/Errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace localscribe::infrastructure {

namespace {

/** @brief Owns a pipe pair; closes whatever is still open on destruction. */
struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        closeRead();
        closeWrite();
    }
    /** Close-on-exec, so concurrently spawned children never inherit each other's pipes. */
    bool open() {
#if defined(__linux__)
        return ::pipe2(fds, O_CLOEXEC) == 0;
#else
        if (::pipe(fds) != 0) return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
#endif
    }
    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }
    void closeRead() {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void closeWrite() {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
};

std::string SystemError(int err) {
    return std::strerror(err);
}

/** @brief Current environment with @p extraEnv entries added or replaced. */
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& extraEnv) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        std::string name = item.substr(0, item.find('='));
        if (extraEnv.count(name) == 0) {
            env.push_back(std::move(item));
        }
    }
    for (const auto& [name, value] : extraEnv) {
        env.push_back(name + "=" + value);
    }
    return env;
}

void DrainPipes(int outFd, int errFd, std::string& out, std::string& err) {
    pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int remaining = 2;
    char buffer[4096];

    while (remaining > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw domain::ProcessError("Failed to read process output: " + SystemError(errno));
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                // EOF (or an unrecoverable read error): stop polling this stream.
                fds[i].fd = -1;
                --remaining;
            }
        }
    }
}

} // namespace

ProcessOutput ProcessRunner::Run(const std::string& executable,
                                 const std::vector<std::string>& args,
                                 const std::map<std::string, std::string>& extraEnv) {
    Pipe outPipe, errPipe, execPipe;
    if (!outPipe.open() || !errPipe.open() || !execPipe.open()) {
        throw domain::ProcessError("Failed to create pipes for " + executable + ": " + SystemError(errno));
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env = BuildEnvironment(extraEnv);
    std::vector<char*> envp;
    for (auto& item : env) {
        envp.push_back(item.data());
    }
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw domain::ProcessError("Failed to spawn " + executable + ": " + SystemError(errno));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only until exec.
        // dup2 clears close-on-exec on the target descriptors only.
        ::dup2(outPipe.writeEnd(), STDOUT_FILENO);
        ::dup2(errPipe.writeEnd(), STDERR_FILENO);
        ::execve(executable.c_str(), argv.data(), envp.data());
        int execErr = errno;
        ssize_t ignored = ::write(execPipe.writeEnd(), &execErr, sizeof(execErr));
        (void)ignored;
        ::_exit(127);
    }

    outPipe.closeWrite();
    errPipe.closeWrite();
    execPipe.closeWrite();

    // A successful exec closes the exec pipe without writing to it.
    int execErr = 0;
    ssize_t n;
    do {
        n = ::read(execPipe.readEnd(), &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);

    ProcessOutput output;
    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw domain::ProcessError("Failed to spawn " + executable + ": " + SystemError(execErr));
    }

    try {
        DrainPipes(outPipe.readEnd(), errPipe.readEnd(), output.stdoutText, output.stderrText);
    } catch (...) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw;
    }

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0) {
        throw domain::ProcessError("Failed to wait for " + executable + ": " + SystemError(errno));
    }

    if (WIFEXITED(status)) {
        output.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.termSignal = WTERMSIG(status);
    }
    return output;
}

} // namespace localscribe::infrastructure
