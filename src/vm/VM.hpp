//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VM.hpp
// Purpose: Reference interpreter executing IL modules.
// Key invariants: Integer arithmetic wraps at the width of its IL type.
//                 Division or remainder by zero traps; signed MIN / -1 wraps
//                 unless a guard intercepts it first.  Traps unwind the whole
//                 run and are reported once in the RunResult.
// Ownership/Lifetime: The VM borrows the module, which must outlive it and
//                     must not change while the VM exists.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"
#include "vm/RuntimeBridge.hpp"
#include "vm/Slot.hpp"
#include "vm/Trap.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sentinel::vm
{

/// @brief A trap together with where it happened.
struct TrapReport
{
    VmError error;
    FrameInfo frame;
    std::string message;

    /// @brief Formatted with vm_format_error().
    std::string toString() const;
};

/// @brief Outcome of one call into the VM.
struct RunResult
{
    /// Return value; disengaged for void functions and after a trap.
    std::optional<int64_t> value;
    std::optional<TrapReport> trap;

    bool trapped() const
    {
        return trap.has_value();
    }
};

/// @brief Interpreter for a verified module.
class VM
{
  public:
    /// @brief Maximum nesting of IL calls before a RuntimeError trap.
    static constexpr unsigned kMaxCallDepth = 1024;

    explicit VM(const il::core::Module &module, RuntimeBridge bridge = RuntimeBridge::withDefaults());

    /// @brief Execute @p function with integer or string arguments.
    RunResult run(std::string_view function, const std::vector<Slot> &args = {});

    /// @brief Execute @c main.
    /// @return main's result truncated to int, or 1 after printing the trap
    ///         to @p err.
    int runMain(std::ostream &err = std::cerr);

  private:
    /// @brief Per-function lookup tables built on first call.
    struct FunctionInfo
    {
        std::unordered_map<std::string_view, size_t> blocks;
        std::vector<il::core::Type::Kind> tempKinds;
    };

    struct Frame;

    /// @brief Instruction currently executing, used to locate traps.
    struct Position
    {
        const il::core::Function *fn = nullptr;
        const il::core::BasicBlock *block = nullptr;
        size_t ip = 0;
        const il::core::Instr *instr = nullptr;
    };

    const il::core::Module &module_;
    RuntimeBridge bridge_;
    std::unordered_map<std::string_view, const il::core::Function *> functions_;
    std::unordered_map<std::string_view, const il::core::Global *> globals_;
    std::unordered_map<const il::core::Function *, FunctionInfo> infos_;
    Position current_;
    unsigned depth_ = 0;

    const FunctionInfo &infoFor(const il::core::Function &fn);
    Slot execFunction(const il::core::Function &fn, const std::vector<Slot> &args);
    Slot call(const il::core::Instr &in, Frame &frame);
};

} // namespace sentinel::vm
