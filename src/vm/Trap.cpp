//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements trap raising and formatting.
//
//===----------------------------------------------------------------------===//

#include "vm/Trap.hpp"

namespace sentinel::vm
{

void vm_raise(TrapKind kind, const std::string &message, int32_t code)
{
    VmError error;
    error.kind = kind;
    error.code = code;
    throw TrapSignal(error, message);
}

std::string vm_format_error(const VmError &error, const FrameInfo &frame, std::string_view message)
{
    const std::string_view function =
        frame.function.empty() ? std::string_view("<unknown>") : std::string_view(frame.function);
    const uint64_t ip = error.ip ? error.ip : frame.ip;
    const int32_t line = error.line >= 0 ? error.line : frame.line;

    std::string result;
    result.reserve(64 + function.size() + frame.block.size() + message.size());

    result.append("Trap @");
    result.append(function);
    if (!frame.block.empty())
    {
        result.push_back(':');
        result.append(frame.block);
    }
    result.push_back('#');
    result.append(std::to_string(ip));
    if (line >= 0)
    {
        result.append(" line ");
        result.append(std::to_string(line));
    }
    result.append(": ");
    result.append(toString(error.kind));
    result.append(" (code=");
    result.append(std::to_string(error.code));
    result.push_back(')');
    if (!message.empty())
    {
        result.append(": ");
        result.append(message);
    }
    return result;
}

} // namespace sentinel::vm
