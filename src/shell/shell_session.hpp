#pragma once

#include <chrono>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "../core/config.hpp"
#include "../ipc/authority_channel.hpp"
#include "../ui/event_loop.hpp"
#include "../ui/replica_store.hpp"
#include "../ui/tab_drag_controller.hpp"
#include "../ui/tab_strip.hpp"

namespace tabsync
{

// Console front end for one UI session: owns the replica store, the strip and
// the drag controller, and turns text commands into intents, pointer
// gestures and local reorders.
//
// Commands:
//   list | open <url> [background|first] | close <n> | activate <n>
//   move <from> <to> | drag <from> <to> | dup <n> | only <n>
//   closeall | openall <url>... | counts
//   title <n> <text> | loading <n> on|off | wait <ms> | stats | help | quit
// <n> is a position in the strip.
class ShellSession
{
   public:
    // Pumps the transport for up to `timeout_ms`; returns false when the
    // authority is gone. Unset for in-process sessions.
    using TransportPump = std::function<bool(int timeout_ms)>;

    static constexpr std::chrono::milliseconds REMOTE_SETTLE{30};

    ShellSession(EventLoop&             loop,
                 ipc::AuthorityChannel& channel,
                 const TabsyncConfig&   config,
                 std::ostream&          out);
    ~ShellSession();

    ShellSession(const ShellSession&)            = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    void set_transport_pump(TransportPump pump) { pump_ = std::move(pump); }

    // Execute one command line. Returns false once the session should end.
    bool execute(const std::string& line);

    // Run the loop (and transport) until nothing is ready, or for `duration`.
    void settle(std::chrono::milliseconds duration = std::chrono::milliseconds::zero());

    void print_tabs() const;
    void print_help() const;

    ReplicaStore&      store() { return store_; }
    TabStrip&          strip() { return strip_; }
    TabDragController& drag() { return drag_; }

   private:
    bool        parse_index(const std::string& token, size_t& out) const;
    void        simulate_drag(size_t from, size_t to);
    const TabId* tab_at(size_t index) const;

    EventLoop&             loop_;
    ipc::AuthorityChannel& channel_;
    std::ostream&          out_;
    ReplicaStore           store_;
    TabStrip               strip_;
    TabDragController      drag_;
    ReplicaStore::ListenerId strip_listener_ = 0;
    TransportPump          pump_;
    bool                   authority_lost_ = false;
};

}   // namespace tabsync
