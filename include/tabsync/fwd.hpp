#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tabsync
{

// Stable tab identifier. Opaque to everything but the registry that mints it.
using TabId = std::string;

// Sentinel for "no element" in index-based APIs (strip, drag session).
inline constexpr size_t NO_INDEX = static_cast<size_t>(-1);

struct TabItem;
struct TabState;
struct Snapshot;
struct CreateOptions;
struct TabsyncConfig;

class Logger;
class EventLoop;
class SuppressionWindow;
class ReplicaStore;
class TabDragController;
class TabStrip;

namespace ipc
{
class AuthorityChannel;
class InProcChannel;
class SocketChannel;
struct Command;
struct CommandResponse;
}   // namespace ipc

namespace daemon
{
class TabRegistry;
class CommandDispatcher;
class PushDebouncer;
}   // namespace daemon

}   // namespace tabsync
