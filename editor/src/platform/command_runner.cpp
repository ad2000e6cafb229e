#include "command_runner.h"

#ifndef _WIN32
#include <cerrno>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace Glide::Editor::Platform {

namespace {

// Exit status of a child whose execvp failed.
constexpr int kExecFailedStatus = 127;

#ifndef _WIN32
void closeBoth(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}
#endif

} // namespace

CommandResult PosixCommandRunner::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) {
        return result;
    }

#ifdef _WIN32
    return result;
#else
    // Everything the child needs is allocated before fork(); the child only
    // redirects descriptors and execs.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int outputPipe[2];
    if (pipe(outputPipe) != 0) {
        return result;
    }

    // Closed by a successful exec; carries errno back when exec fails.
    int statusPipe[2];
    if (pipe(statusPipe) != 0) {
        closeBoth(outputPipe);
        return result;
    }
    if (fcntl(statusPipe[1], F_SETFD, FD_CLOEXEC) != 0) {
        closeBoth(outputPipe);
        closeBoth(statusPipe);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        closeBoth(outputPipe);
        closeBoth(statusPipe);
        return result;
    }

    if (pid == 0) {
        // Child: stdout -> pipe, stderr -> /dev/null
        close(statusPipe[0]);
        dup2(outputPipe[1], STDOUT_FILENO);
        close(outputPipe[0]);
        close(outputPipe[1]);

        int devNull = open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }

        execvp(args[0], args.data());

        int execErrno = errno;
        ssize_t ignored = write(statusPipe[1], &execErrno, sizeof(execErrno));
        (void)ignored;
        _exit(kExecFailedStatus);
    }

    close(outputPipe[1]);
    close(statusPipe[1]);

    int execErrno = 0;
    ssize_t statusBytes;
    do {
        statusBytes = read(statusPipe[0], &execErrno, sizeof(execErrno));
    } while (statusBytes < 0 && errno == EINTR);
    close(statusPipe[0]);
    const bool execFailed = statusBytes > 0;

    char buffer[4096];
    for (;;) {
        ssize_t n = read(outputPipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(outputPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return result;
        }
    }

    if (execFailed) {
        result.output.clear();
        return result;
    }

    result.launched = true;
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        // Killed by a signal
        result.exitCode = -1;
    }
    return result;
#endif
}

std::string describeCommand(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) text += ' ';
        if (arg.find(' ') != std::string::npos) {
            text += '\'' + arg + '\'';
        } else {
            text += arg;
        }
    }
    return text;
}

} // namespace Glide::Editor::Platform
