#pragma once

#include <cstdint>
#include <span>

#include "../ipc/message.hpp"
#include "tab_registry.hpp"

namespace tabsync::daemon
{

// Maps wire commands onto registry operations and turns the registry's
// Result values into CommandResponses. Shared by the socket daemon and the
// in-process channel so both authorities behave identically.
class CommandDispatcher
{
   public:
    struct Outcome
    {
        ipc::CommandResponse response;
        // True when the registry revision moved, i.e. other sessions need a
        // routine push.
        bool state_changed = false;
    };

    explicit CommandDispatcher(TabRegistry& registry);

    Outcome dispatch(const ipc::Command& cmd);

    // Decode a CMD_REQUEST payload and dispatch it. Undecodable payloads are
    // answered with a Malformed failure.
    Outcome dispatch_payload(std::span<const uint8_t> payload);

    TabRegistry& registry() { return registry_; }

    uint64_t dispatched_count() const { return dispatched_; }
    uint64_t failed_count() const { return failed_; }

   private:
    ipc::CommandResponse execute(const ipc::Command& cmd);

    TabRegistry& registry_;
    uint64_t     dispatched_ = 0;
    uint64_t     failed_     = 0;
};

}   // namespace tabsync::daemon
