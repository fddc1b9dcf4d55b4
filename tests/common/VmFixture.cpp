//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/VmFixture.cpp
// Purpose: Implement shared VM execution helpers for tests.
// Key invariants: The child reports through its exit status and a stderr pipe.
//
//===----------------------------------------------------------------------===//

#include "common/VmFixture.hpp"

#include <array>
#include <cassert>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace sentinel::tests
{

vm::RunResult VmFixture::call(const il::core::Module &module,
                              const std::string &function,
                              std::initializer_list<int64_t> args) const
{
    std::vector<vm::Slot> slots;
    for (int64_t a : args)
    {
        vm::Slot s;
        s.i64 = a;
        slots.push_back(s);
    }
    vm::VM machine(module);
    return machine.run(function, slots);
}

VmTrapResult VmFixture::runMainInChild(const il::core::Module &module) const
{
    VmTrapResult result{};

    std::array<int, 2> fds{};
    const int pipeStatus = ::pipe(fds.data());
    assert(pipeStatus == 0);
    (void)pipeStatus;

    const pid_t pid = ::fork();
    assert(pid >= 0);
    if (pid == 0)
    {
        ::close(fds[0]);
        ::dup2(fds[1], STDERR_FILENO);
        vm::VM machine(module);
        const int code = machine.runMain(std::cerr);
        std::cerr.flush();
        _exit(code);
    }

    ::close(fds[1]);
    std::string buffer;
    std::array<char, 512> temp{};
    while (true)
    {
        const ssize_t count = ::read(fds[0], temp.data(), temp.size());
        if (count <= 0)
            break;
        buffer.append(temp.data(), static_cast<std::size_t>(count));
    }
    ::close(fds[0]);

    int status = 0;
    const pid_t waitStatus = ::waitpid(pid, &status, 0);
    assert(waitStatus == pid);
    (void)waitStatus;

    result.stderrText = std::move(buffer);
    result.exited = WIFEXITED(status);
    if (result.exited)
        result.exitCode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exitCode = 128 + WTERMSIG(status);
    return result;
}

} // namespace sentinel::tests
