//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/TestIRBuilder.hpp
// Purpose: Build the small single-operation modules most tests start from.
// Key invariants: Every helper appends a complete, verifiable function.
// Ownership/Lifetime: Owns the module under construction.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/build/IRBuilder.hpp"
#include "il/core/Module.hpp"
#include "support/source_location.hpp"

#include <string>

namespace sentinel::tests
{

/// @brief Helper that appends synthetic functions to one module.
class TestIRBuilder
{
  public:
    explicit TestIRBuilder(std::string packagePath = "example.com/app");

    TestIRBuilder(const TestIRBuilder &) = delete;
    TestIRBuilder &operator=(const TestIRBuilder &) = delete;

    [[nodiscard]] static support::SourceLoc defaultLoc() noexcept
    {
        return {1, 3, 5};
    }

    [[nodiscard]] il::core::Module &module() noexcept
    {
        return module_;
    }

    /// @brief Append `name(T %t0, T %t1) -> T { entry: %t2 = op T %t0, %t1; ret %t2 }`.
    void addBinaryFunction(const std::string &name,
                           il::core::Opcode op,
                           il::core::Type::Kind kind,
                           support::SourceLoc loc = defaultLoc());

    /// @brief Append `main() -> T { entry: %t0 = op T lhs, rhs; ret %t0 }`.
    void addConstantMain(il::core::Opcode op, il::core::Type::Kind kind, long long lhs, long long rhs);

  private:
    il::core::Module module_{};
    il::build::IRBuilder builder_;
};

} // namespace sentinel::tests
