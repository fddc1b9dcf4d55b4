//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the package exemption policy.  Membership is a pure function of
// the package path: exact entries are looked up by binary search, prefix
// entries are tested at segment boundaries.
//
//===----------------------------------------------------------------------===//

#include "il/transform/overflow/ExemptionSet.hpp"

#include <algorithm>

namespace sentinel::il::transform::overflow
{

using support::Expected;
using support::makeError;

namespace
{

void sortUnique(std::vector<std::string> &entries)
{
    std::sort(entries.begin(), entries.end());
    entries.erase(std::unique(entries.begin(), entries.end()), entries.end());
}

/// @brief True when @p path is @p prefix or lies below it.
bool matchesPrefix(std::string_view path, std::string_view prefix)
{
    if (path.size() < prefix.size() || path.compare(0, prefix.size(), prefix) != 0)
        return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

ExemptionSet::Builder &ExemptionSet::Builder::addExact(std::string path)
{
    exact_.push_back(std::move(path));
    return *this;
}

ExemptionSet::Builder &ExemptionSet::Builder::addPrefix(std::string prefix)
{
    while (!prefix.empty() && prefix.back() == '/')
        prefix.pop_back();
    prefixes_.push_back(std::move(prefix));
    return *this;
}

ExemptionSet ExemptionSet::Builder::build() const
{
    ExemptionSet set;
    set.exact_ = exact_;
    set.prefixes_ = prefixes_;
    sortUnique(set.exact_);
    sortUnique(set.prefixes_);
    return set;
}

ExemptionSet ExemptionSet::defaults()
{
    return Builder()
        .addExact("runtime")
        .addExact("sync")
        .addExact("os")
        .addExact("syscall")
        .addPrefix("internal")
        .addExact("math")
        .addExact("unsafe")
        .build();
}

const ExemptionSet &ExemptionSet::processDefault()
{
    static const ExemptionSet instance = defaults();
    return instance;
}

Expected<ExemptionSet> ExemptionSet::parse(std::string_view text)
{
    Builder builder;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t comma = text.find(',', start);
        if (comma == std::string_view::npos)
            comma = text.size();
        const std::string_view entry = trim(text.substr(start, comma - start));
        start = comma + 1;

        if (entry.empty())
            return makeError({}, "empty exemption entry");
        if (entry.front() == '/')
            return makeError({}, "exemption entry '" + std::string(entry) + "' must not start with '/'");

        const bool isPrefix = entry.size() >= 2 && entry.substr(entry.size() - 2) == "/*";
        const std::string_view path = isPrefix ? entry.substr(0, entry.size() - 2) : entry;
        if (path.empty() || path.find('*') != std::string_view::npos)
            return makeError({}, "invalid exemption entry '" + std::string(entry) + "'");

        if (isPrefix)
            builder.addPrefix(std::string(path));
        else
            builder.addExact(std::string(path));
    }
    return builder.build();
}

bool ExemptionSet::isExempt(std::string_view packagePath) const
{
    if (std::binary_search(exact_.begin(), exact_.end(), packagePath))
        return true;
    return std::any_of(prefixes_.begin(),
                       prefixes_.end(),
                       [packagePath](const std::string &prefix)
                       { return matchesPrefix(packagePath, prefix); });
}

std::string ExemptionSet::toString() const
{
    std::string out;
    for (const auto &e : exact_)
    {
        if (!out.empty())
            out += ',';
        out += e;
    }
    for (const auto &p : prefixes_)
    {
        if (!out.empty())
            out += ',';
        out += p + "/*";
    }
    return out;
}

bool shouldInstrument(std::string_view packagePath)
{
    return ExemptionSet::processDefault().shouldInstrument(packagePath);
}

} // namespace sentinel::il::transform::overflow
