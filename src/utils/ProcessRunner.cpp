#include "utils/ProcessRunner.h"
#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// SIGTERM the whole group, give it a short grace period, then SIGKILL.
// Always reaps the child so no zombie is left behind.
void terminateGroup(pid_t pid) {
    int status = 0;
    ::killpg(pid, SIGTERM);
    for (int i = 0; i < 20; ++i) {
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            ::killpg(pid, SIGKILL);  // stragglers that outlived the leader
            return;
        }
        ::usleep(10000);
    }
    ::killpg(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

struct Stream {
    int fd = -1;
    std::string* sink = nullptr;
    bool truncated = false;
};

// Returns false once the stream reached EOF or failed.
bool drain(Stream& stream, std::size_t limit) {
    char buffer[8192];
    while (true) {
        ssize_t n = ::read(stream.fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::size_t room = stream.sink->size() < limit ? limit - stream.sink->size() : 0;
            std::size_t take = std::min(room, static_cast<std::size_t>(n));
            stream.sink->append(buffer, take);
            if (take < static_cast<std::size_t>(n)) stream.truncated = true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

std::vector<std::string> buildEnvironment(const std::vector<std::string>& extraEnv) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        bool overridden = std::any_of(extraEnv.begin(), extraEnv.end(), [&](const std::string& extra) {
            return extra.compare(0, key.size() + 1, key + "=") == 0;
        });
        if (!overridden) env.push_back(entry);
    }
    env.insert(env.end(), extraEnv.begin(), extraEnv.end());
    return env;
}

} // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 const fs::path& workingDir,
                                 const Deadline& deadline,
                                 const std::vector<std::string>& extraEnv,
                                 std::size_t outputLimit) {
    ProcessResult result;
    if (argv.empty() || argv[0].empty()) {
        result.spawnFailed = true;
        result.exitCode = 127;
        result.error = "No program to run";
        return result;
    }

    // Everything the child needs is prepared before fork(); after it the
    // child only makes async-signal-safe calls.
    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    std::vector<std::string> envStrings = buildEnvironment(extraEnv);
    std::vector<char*> envp;
    for (auto& e : envStrings) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    std::string cwd = workingDir.string();

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (::pipe(outPipe) != 0 || ::pipe(errPipe) != 0 || ::pipe(execPipe) != 0) {
        int code = errno;
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
        result.spawnFailed = true;
        result.exitCode = 127;
        result.error = std::string("Failed to create pipes: ") + std::strerror(code);
        return result;
    }
    ::fcntl(execPipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        int code = errno;
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
        result.spawnFailed = true;
        result.exitCode = 127;
        result.error = std::string("fork() failed: ") + std::strerror(code);
        return result;
    }

    if (pid == 0) { // Child
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        ::close(execPipe[0]);

        if (::chdir(cwd.c_str()) != 0) {
            int code = errno;
            ssize_t ignored = ::write(execPipe[1], &code, sizeof(code));
            (void)ignored;
            ::_exit(127);
        }
        ::execvpe(args[0], args.data(), envp.data());
        int code = errno;
        ssize_t ignored = ::write(execPipe[1], &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    // The exec pipe is close-on-exec: EOF means exec succeeded, an int means
    // chdir or exec failed with that errno.
    int execErrno = 0;
    ssize_t got;
    do {
        got = ::read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (got == -1 && errno == EINTR);
    closeFd(execPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        result.spawnFailed = true;
        result.exitCode = 127;
        result.error = "Failed to start '" + argv[0] + "': " + std::strerror(execErrno);
        return result;
    }

    Stream streams[2];
    streams[0].fd = outPipe[0];
    streams[0].sink = &result.output;
    streams[1].fd = errPipe[0];
    streams[1].sink = &result.error;
    setNonBlocking(streams[0].fd);
    setNonBlocking(streams[1].fd);

    while (streams[0].fd >= 0 || streams[1].fd >= 0) {
        if (deadline.expired()) {
            result.timedOut = true;
            break;
        }

        pollfd fds[2];
        Stream* owners[2];
        nfds_t count = 0;
        for (auto& stream : streams) {
            if (stream.fd < 0) continue;
            fds[count].fd = stream.fd;
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            owners[count] = &stream;
            ++count;
        }

        int waitMs = static_cast<int>(std::min<long long>(deadline.remaining().count(), 100));
        int rc = ::poll(fds, count, waitMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (!drain(*owners[i], outputLimit)) {
                closeFd(owners[i]->fd);
            }
        }
    }

    if (!result.timedOut) {
        // Both pipes are closed but the process may still be alive.
        int status = 0;
        while (true) {
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                result.exitCode = decodeStatus(status);
                break;
            }
            if (w < 0 && errno != EINTR) {
                result.exitCode = -1;
                break;
            }
            if (deadline.expired()) {
                result.timedOut = true;
                break;
            }
            ::usleep(10000);
        }
    }

    if (result.timedOut) {
        terminateGroup(pid);
        result.exitCode = -1;
    }

    for (auto& stream : streams) {
        closeFd(stream.fd);
        if (stream.truncated) {
            stream.sink->append("\n... [output truncated]");
        }
    }
    return result;
}
