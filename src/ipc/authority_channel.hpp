#pragma once

#include <cstdint>
#include <functional>

#include "message.hpp"

namespace tabsync::ipc
{

// ─── AuthorityChannel ────────────────────────────────────────────────────────
// The UI side's only view of the authority. Injected into the replica store so
// the store never knows whether the registry lives in this process or behind
// a socket.
//
// Every callback runs on the UI event loop, never on the caller's stack.

class AuthorityChannel
{
   public:
    using ResponseHandler = std::function<void(const CommandResponse&)>;
    using PushHandler     = std::function<void(const Snapshot&)>;
    using SubscriptionId  = uint64_t;

    static constexpr SubscriptionId INVALID_SUBSCRIPTION = 0;

    virtual ~AuthorityChannel() = default;

    // Fire-and-forget command. The response, if any, is discarded.
    virtual void send(const Command& cmd) = 0;

    // Asynchronous request/response. `handler` is called exactly once: with
    // the authority's response, or with a Transport/Timeout failure.
    virtual void invoke(const Command& cmd, ResponseHandler handler) = 0;

    // Register for snapshot pushes.
    virtual SubscriptionId subscribe(PushHandler handler) = 0;
    virtual void           unsubscribe(SubscriptionId id) = 0;
};

}   // namespace tabsync::ipc
