#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

#include "../ui/event_loop.hpp"
#include "authority_channel.hpp"
#include "transport.hpp"

namespace tabsync::ipc
{

// Channel to a tabsync-authority daemon over a Unix domain socket.
//
// All I/O happens on the loop thread: the owner calls poll() from its main
// loop, which drains readable messages and posts responses and pushes to the
// loop. Pending invokes are failed with Transport when the connection drops
// and with Timeout after invoke_timeout; a late response is dropped.
class SocketChannel : public AuthorityChannel
{
   public:
    static constexpr std::chrono::milliseconds DEFAULT_INVOKE_TIMEOUT{3000};
    static constexpr int                       HANDSHAKE_TIMEOUT_MS = 2000;

    explicit SocketChannel(EventLoop&                loop,
                           std::chrono::milliseconds invoke_timeout = DEFAULT_INVOKE_TIMEOUT);
    ~SocketChannel() override;

    SocketChannel(const SocketChannel&)            = delete;
    SocketChannel& operator=(const SocketChannel&) = delete;

    // Connect and perform the HELLO/WELCOME handshake (blocking, bounded by
    // HANDSHAKE_TIMEOUT_MS). Returns false if the daemon is unreachable.
    bool connect(const std::string& socket_path, const std::string& client_name = "tabsync-shell");

    // Send BYE, close the socket, fail pending invokes.
    void disconnect();

    bool      connected() const { return conn_ && conn_->is_open(); }
    SessionId session_id() const { return session_id_; }

    // Read every message that is available within `timeout_ms`. Returns false
    // once the connection is gone.
    bool poll(int timeout_ms = 0);

    size_t pending_requests() const { return pending_.size(); }

    void           send(const Command& cmd) override;
    void           invoke(const Command& cmd, ResponseHandler handler) override;
    SubscriptionId subscribe(PushHandler handler) override;
    void           unsubscribe(SubscriptionId id) override;

   private:
    struct Pending
    {
        ResponseHandler    handler;
        EventLoop::TimerId timeout_timer = EventLoop::INVALID_TIMER;
    };

    RequestId send_command(const Command& cmd);
    void      handle_message(const Message& msg);
    void      complete(RequestId id, CommandResponse response);
    void      fail_all(TabError error, const std::string& detail);
    void      connection_lost();

    EventLoop&                              loop_;
    std::chrono::milliseconds               invoke_timeout_;
    std::unique_ptr<Connection>             conn_;
    SessionId                               session_id_      = INVALID_SESSION;
    RequestId                               next_request_id_ = 1;
    std::unordered_map<RequestId, Pending>  pending_;
    std::map<SubscriptionId, PushHandler>   subscribers_;
    SubscriptionId                          next_subscription_ = 1;
    std::shared_ptr<bool>                   alive_ = std::make_shared<bool>(true);
};

}   // namespace tabsync::ipc
