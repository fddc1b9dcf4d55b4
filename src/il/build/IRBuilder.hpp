//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the IRBuilder class, which provides a high-level API for
// constructing IL modules programmatically. Tests and embedding front ends use
// it to produce the typed arithmetic the overflow guard consumes.
//
// The IRBuilder class manages the insertion point (current basic block) and
// provides methods for emitting instructions, managing control flow, and
// tracking SSA temporaries.
//
// Typical Usage Pattern:
//   Module m;
//   IRBuilder builder(m);
//   auto &fn = builder.startFunction("main", Type(Type::Kind::I32), {});
//   auto &entry = builder.addBlock(fn, "entry");
//   builder.setInsertPoint(entry);
//   auto sum = builder.emitBinary(Opcode::Add, Type(Type::Kind::I32),
//                                 Value::constInt(10), Value::constInt(32), {});
//   builder.emitRet(sum, {});
//
// Blocks live in a std::vector inside the function, so creating a block
// invalidates references to blocks created earlier. Create the blocks of a
// function first, then position the builder.
//
// The IRBuilder does NOT own the Module it operates on. The caller must ensure
// the Module outlives all builder operations.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/BasicBlock.hpp"
#include "il/core/Function.hpp"
#include "il/core/Module.hpp"
#include "il/core/Opcode.hpp"
#include "il/core/Value.hpp"
#include "support/source_location.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sentinel::il::build
{

/// @brief Helper to construct IL modules.
/// @invariant Insertion point must be set before emitting instructions.
/// @ownership Holds a reference to the module; does not own it.
class IRBuilder
{
  public:
    /// @brief Create builder operating on module @p m.
    /// @param m Module to mutate.
    explicit IRBuilder(core::Module &m);

    /// @brief Add external function declaration.
    /// @param name Symbol name without '@'.
    /// @param ret Return type.
    /// @param params Parameter types.
    /// @return Reference to the stored extern.
    core::Extern &addExtern(const std::string &name,
                            core::Type ret,
                            const std::vector<core::Type> &params);

    /// @brief Add global string constant.
    /// @param name Global symbol name.
    /// @param value String contents.
    core::Global &addGlobalStr(const std::string &name, const std::string &value);

    /// @brief Begin definition of function @p name and make it current.
    /// @details Parameters receive temporaries 0..N-1 in order.
    core::Function &startFunction(const std::string &name,
                                  core::Type ret,
                                  const std::vector<core::Param> &params);

    /// @brief Append a basic block with optional parameters to @p fn.
    core::BasicBlock &createBlock(core::Function &fn,
                                  const std::string &label,
                                  const std::vector<core::Param> &params = {});

    /// @brief Append a parameterless basic block to @p fn.
    core::BasicBlock &addBlock(core::Function &fn, const std::string &label);

    /// @brief Access the temporary bound to parameter @p idx of @p bb.
    core::Value blockParam(core::BasicBlock &bb, unsigned idx);

    /// @brief Access the temporary bound to function parameter @p idx.
    core::Value param(core::Function &fn, unsigned idx);

    /// @brief Set current insertion block.
    void setInsertPoint(core::BasicBlock &bb);

    /// @brief Emit a two-operand arithmetic or bitwise instruction.
    /// @return Temporary holding the result.
    core::Value emitBinary(core::Opcode op,
                           core::Type type,
                           core::Value lhs,
                           core::Value rhs,
                           support::SourceLoc loc);

    /// @brief Emit an integer comparison producing i1.
    core::Value emitCmp(core::Opcode op, core::Value lhs, core::Value rhs, support::SourceLoc loc);

    /// @brief Emit sext, zext or trunc of @p v to @p type.
    core::Value emitCast(core::Opcode op, core::Type type, core::Value v, support::SourceLoc loc);

    /// @brief Emit unconditional branch to @p dst.
    void br(core::BasicBlock &dst, const std::vector<core::Value> &args = {});

    /// @brief Emit conditional branch on @p cond.
    void cbr(core::Value cond,
             core::BasicBlock &t,
             const std::vector<core::Value> &targs,
             core::BasicBlock &f,
             const std::vector<core::Value> &fargs);

    /// @brief Emit call to @p callee.
    /// @param dst Optional destination temporary.
    /// @throws std::logic_error when @p callee is not declared in the module.
    void emitCall(const std::string &callee,
                  const std::vector<core::Value> &args,
                  const std::optional<core::Value> &dst,
                  support::SourceLoc loc);

    /// @brief Emit return with optional value.
    void emitRet(const std::optional<core::Value> &v, support::SourceLoc loc);

    /// @brief Emit an unconditional trap terminator.
    void emitTrap(support::SourceLoc loc);

    /// @brief Reserve the next SSA temporary id in the current function.
    unsigned reserveTempId();

  private:
    core::Module &mod;                   ///< Module being constructed
    core::Function *curFunc{nullptr};    ///< Current function
    core::BasicBlock *curBlock{nullptr}; ///< Current insertion block
    unsigned nextTemp{0};                ///< Next temporary id
    std::unordered_map<std::string, core::Type>
        calleeReturnTypes; ///< Cached return types keyed by callee name

    /// @brief Append @p instr to the current block.
    core::Instr &append(core::Instr instr);

    /// @brief Emit a single-result instruction and return its temporary.
    core::Value emitValue(core::Instr instr);
};

} // namespace sentinel::il::build
