//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the extern registry and the built-in runtime routines.
//
//===----------------------------------------------------------------------===//

#include "vm/RuntimeBridge.hpp"

#include "vm/Trap.hpp"

namespace sentinel::vm
{

namespace
{

Slot rt_panic(const std::vector<Slot> &args)
{
    const char *msg = args.empty() ? nullptr : args[0].str;
    vm_raise(TrapKind::Overflow, msg ? msg : "panic");
}

} // namespace

RuntimeBridge RuntimeBridge::withDefaults()
{
    RuntimeBridge bridge;
    bridge.registerExtern("rt_panic", &rt_panic);
    return bridge;
}

void RuntimeBridge::registerExtern(std::string name, Handler handler)
{
    externs_[std::move(name)] = std::move(handler);
}

const RuntimeBridge::Handler *RuntimeBridge::find(std::string_view name) const
{
    auto it = externs_.find(std::string(name));
    return it == externs_.end() ? nullptr : &it->second;
}

} // namespace sentinel::vm
