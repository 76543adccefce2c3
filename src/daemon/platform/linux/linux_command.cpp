#include "platform/command.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

std::expected<CommandResult, std::string>
run_command(const std::vector<std::string>& argv, const std::string& working_dir) {
    if (argv.empty()) {
        return std::unexpected("empty command");
    }

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout to pipe, stdin/stderr to /dev/null
        ::dup2(pipefd[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        if (!working_dir.empty() && ::chdir(working_dir.c_str()) < 0) {
            ::_exit(126);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(pipefd[1]);

    std::string output;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        output.append(buf, static_cast<size_t>(n));
    }
    ::close(pipefd[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 127) {
            return std::unexpected(argv[0] + ": command not found");
        }
        if (code == 126 && !working_dir.empty()) {
            return std::unexpected("cannot enter " + working_dir);
        }
        return CommandResult{.exit_code = code, .output = std::move(output)};
    }

    return std::unexpected(argv[0] + " terminated by signal " + std::to_string(WTERMSIG(status)));
}

} // namespace platform
