//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/transform/overflow/ExemptionSet.hpp
// Purpose: Declares the package exemption policy consulted once per
//          compilation unit by the overflow guard.
// Key invariants: A constructed set is immutable. Prefix entries match at
//                 path-segment boundaries only.
// Ownership/Lifetime: Value type; processDefault() returns a process-wide
//                     instance built on first use and never mutated.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sentinel::il::transform::overflow
{

/// @brief Immutable set of exact package paths and path prefixes whose
///        compilation units are never instrumented.
///
/// @details An exact entry matches only the identical path. A prefix entry
///          `p` (written `p/*` in configuration strings) matches `p` itself
///          and every path of the form `p/...`; it does not match a path that
///          merely shares the characters of `p`, such as `pfoo`.
class ExemptionSet
{
  public:
    /// @brief Incrementally collects entries and produces an immutable set.
    class Builder
    {
      public:
        /// @brief Exempt exactly @p path.
        Builder &addExact(std::string path);

        /// @brief Exempt @p prefix and every path below it.
        /// @param prefix Path without a trailing "/*" or "/".
        Builder &addPrefix(std::string prefix);

        /// @brief Produce the set; entries are sorted and de-duplicated.
        ExemptionSet build() const;

      private:
        std::vector<std::string> exact_;
        std::vector<std::string> prefixes_;
    };

    /// @brief An empty set: every package is instrumented.
    ExemptionSet() = default;

    /// @brief The default policy: runtime, sync, os, syscall, internal/*,
    ///        math and unsafe.
    static ExemptionSet defaults();

    /// @brief Process-wide default set, built once on first use.
    static const ExemptionSet &processDefault();

    /// @brief Parse a comma-separated configuration string.
    /// @details Entries are trimmed of surrounding blanks. A trailing "/*"
    ///          marks a prefix entry. Empty entries, a leading '/', and '*'
    ///          anywhere else are rejected.
    /// @return The parsed set or a diagnostic naming the offending entry.
    static support::Expected<ExemptionSet> parse(std::string_view text);

    /// @brief True when @p packagePath matches an exact or prefix entry.
    [[nodiscard]] bool isExempt(std::string_view packagePath) const;

    /// @brief Negation of isExempt(); the unit-level instrumentation gate.
    [[nodiscard]] bool shouldInstrument(std::string_view packagePath) const
    {
        return !isExempt(packagePath);
    }

    const std::vector<std::string> &exactEntries() const
    {
        return exact_;
    }

    const std::vector<std::string> &prefixEntries() const
    {
        return prefixes_;
    }

    /// @brief Render the set in parse() syntax, exact entries first.
    std::string toString() const;

  private:
    std::vector<std::string> exact_;
    std::vector<std::string> prefixes_;
};

/// @brief Unit-level gate against the process-wide default set.
[[nodiscard]] bool shouldInstrument(std::string_view packagePath);

} // namespace sentinel::il::transform::overflow
