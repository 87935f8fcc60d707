// child_process.cpp - posix_spawn()/waitpid() wrapper.

#include "system/child_process.hpp"

#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace aurix {

ChildProcess::ChildProcess(ChildProcess&& other) noexcept : pid_(other.pid_) {
    other.pid_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

Result ChildProcess::Spawn(const std::string& exe,
                           const std::vector<std::string>& args,
                           ChildProcess& out) {
    out.pid_ = -1;

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    const int rc = ::posix_spawn(&pid, exe.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        return Result::Fail(rc, "posix_spawn " + exe + " failed: " + std::strerror(rc));
    }

    out.pid_ = pid;
    return Result::Ok();
}

Result ChildProcess::Wait(int& out_status) {
    if (pid_ <= 0)
        return Result::Fail(ECHILD, "no child process to wait for");

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno == EINTR)
            continue;
        const int e = errno;
        return Result::Fail(e, "waitpid failed: " + std::string(std::strerror(e)));
    }

    pid_ = -1;
    out_status = status;
    return Result::Ok();
}

bool ExitedSuccessfully(int wait_status) {
    return WIFEXITED(wait_status) && WEXITSTATUS(wait_status) == 0;
}

std::string DescribeWaitStatus(int wait_status) {
    if (WIFEXITED(wait_status))
        return "exit code " + std::to_string(WEXITSTATUS(wait_status));
    if (WIFSIGNALED(wait_status)) {
        const int sig = WTERMSIG(wait_status);
        return "killed by signal " + std::to_string(sig) + " (" + ::strsignal(sig) + ")";
    }
    return "wait status " + std::to_string(wait_status);
}

} // namespace aurix
