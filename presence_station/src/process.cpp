#include "logger.hpp"
#include "process.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#define PROCESS_POLL_PERIOD     (50)    /* in ms */

bool run_process(const std::vector<std::string> &args, unsigned int timeout_s)
{
    if (args.empty())
        return false;

    std::vector<char*> argv;
    for (auto &a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(NULL);

    pid_t pid = fork();
    if (pid < 0) {
        std::stringstream ss;
        ss << "Failed to fork for " << args[0] << ": " << strerror(errno);
        Logger::err(ss.str());
        return false;
    }

    if (pid == 0) {
        int fd = open("/dev/null", O_RDWR);
        if (fd >= 0) {
            dup2(fd, STDIN_FILENO);
            dup2(fd, STDOUT_FILENO);
            dup2(fd, STDERR_FILENO);
            close(fd);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_s);
    int status = 0;
    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid)
            break;

        if (ret < 0 && errno != EINTR) {
            std::stringstream ss;
            ss << "waitpid failed for " << args[0] << ": " << strerror(errno);
            Logger::err(ss.str());
            return false;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            std::stringstream ss;
            ss << args[0] << " did not exit after " << timeout_s << "s, killing it";
            Logger::warn(ss.str());
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(PROCESS_POLL_PERIOD));
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::stringstream ss;
        ss << args[0] << " failed";
        if (WIFEXITED(status))
            ss << " with status " << WEXITSTATUS(status);
        Logger::debug(ss.str());
        return false;
    }

    return true;
}
