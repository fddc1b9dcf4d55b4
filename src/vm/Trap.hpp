//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trap.hpp
// Purpose: Trap classification, trap metadata and the exception used to unwind
//          the interpreter when a trap is raised.
// Key invariants: A raised trap never resumes execution of the trapping
//                 function.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sentinel::vm
{

/// @brief Classification of runtime traps.
enum class TrapKind : int32_t
{
    DivideByZero = 0, ///< Integer division or remainder by zero.
    Overflow = 1,     ///< Arithmetic overflow reported by a guard.
    DomainError = 2,  ///< Explicit trap instruction.
    RuntimeError = 3, ///< Catch-all for unexpected runtime failures.
};

/// @brief Structured description of a trap.
struct VmError
{
    TrapKind kind = TrapKind::RuntimeError; ///< Trap classification.
    int32_t code = 0;                       ///< Secondary error code.
    uint64_t ip = 0;                        ///< Instruction index within block.
    int32_t line = -1;                      ///< Source line, or -1 when unknown.
};

/// @brief Location of the trapping instruction.
struct FrameInfo
{
    std::string function; ///< Function in which the trap occurred.
    std::string block;    ///< Label of the trapping block.
    uint64_t ip = 0;      ///< Instruction index of the trap.
    int32_t line = -1;    ///< Source line for diagnostics.
};

constexpr std::string_view toString(TrapKind kind) noexcept
{
    switch (kind)
    {
        case TrapKind::DivideByZero:
            return "DivideByZero";
        case TrapKind::Overflow:
            return "Overflow";
        case TrapKind::DomainError:
            return "DomainError";
        case TrapKind::RuntimeError:
            return "RuntimeError";
    }
    return "RuntimeError";
}

/// @brief Exception carrying a trap out of the interpreter loop.
class TrapSignal : public std::runtime_error
{
  public:
    TrapSignal(VmError error, const std::string &message)
        : std::runtime_error(message), error_(error)
    {
    }

    const VmError &error() const noexcept
    {
        return error_;
    }

  private:
    VmError error_;
};

/// @brief Raise a trap of @p kind with @p message.
[[noreturn]] void vm_raise(TrapKind kind, const std::string &message, int32_t code = 0);

/// @brief Render "Trap @fn:block#ip line N: Kind (code=C): message".
/// @details The line and message parts are omitted when unknown or empty.
std::string vm_format_error(const VmError &error, const FrameInfo &frame, std::string_view message);

} // namespace sentinel::vm
