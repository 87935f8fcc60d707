#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/types.h>
#include <vector>

namespace aurix {

// Handle to a process started with posix_spawn(). stdin/stdout/stderr and
// the environment are inherited from the caller.
//
// Destroying a handle that was never waited on does not signal or reap the
// child: it keeps running on its own.
class ChildProcess {
  public:
    ChildProcess() = default;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ~ChildProcess() = default;

    // args excludes argv[0], which is set to exe.
    static Result Spawn(const std::string& exe,
                        const std::vector<std::string>& args,
                        ChildProcess& out);

    // Blocks until the child terminates. out_status receives the raw
    // waitpid() status.
    Result Wait(int& out_status);

    pid_t Pid() const { return pid_; }
    bool Running() const { return pid_ > 0; }

  private:
    pid_t pid_{-1};
};

bool ExitedSuccessfully(int wait_status);

// "exit code 3", "killed by signal 9 (Killed)", ...
std::string DescribeWaitStatus(int wait_status);

} // namespace aurix
