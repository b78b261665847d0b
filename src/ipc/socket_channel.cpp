#include "socket_channel.hpp"

#include <tabsync/logger.hpp>

#include "codec.hpp"

namespace tabsync::ipc
{

SocketChannel::SocketChannel(EventLoop& loop, std::chrono::milliseconds invoke_timeout)
    : loop_(loop), invoke_timeout_(invoke_timeout)
{
}

SocketChannel::~SocketChannel()
{
    disconnect();
    *alive_ = false;
}

bool SocketChannel::connect(const std::string& socket_path, const std::string& client_name)
{
    disconnect();

    conn_ = connect_to(socket_path);
    if (!conn_)
    {
        TABSYNC_LOG_ERROR("ipc", "cannot connect to authority at {}", socket_path);
        return false;
    }

    HelloPayload hello;
    hello.client_name = client_name;
    if (!conn_->send(MessageType::HELLO, INVALID_SESSION, INVALID_REQUEST, encode_hello(hello)))
    {
        TABSYNC_LOG_ERROR("ipc", "handshake send failed");
        conn_.reset();
        return false;
    }

    if (!conn_->wait_readable(HANDSHAKE_TIMEOUT_MS))
    {
        TABSYNC_LOG_ERROR("ipc", "no WELCOME from authority within {} ms", HANDSHAKE_TIMEOUT_MS);
        conn_.reset();
        return false;
    }

    Message    reply;
    ReadStatus status = conn_->read(reply);
    if (status != ReadStatus::Frame || reply.header.type != MessageType::WELCOME)
    {
        TABSYNC_LOG_ERROR("ipc", "unexpected handshake reply ({})", read_status_to_string(status));
        conn_.reset();
        return false;
    }

    auto welcome = decode_welcome(reply.payload);
    if (!welcome)
    {
        TABSYNC_LOG_ERROR("ipc", "malformed WELCOME payload");
        conn_.reset();
        return false;
    }

    session_id_ = welcome->session_id;
    TABSYNC_LOG_INFO("ipc",
                     "connected to {} as session {} (push debounce {} ms)",
                     socket_path,
                     session_id_,
                     welcome->push_debounce_ms);
    return true;
}

void SocketChannel::disconnect()
{
    if (conn_ && conn_->is_open())
    {
        if (!conn_->send(MessageType::BYE, session_id_, INVALID_REQUEST, {}))
            TABSYNC_LOG_DEBUG("ipc", "BYE not delivered");
        conn_->close();
    }
    conn_.reset();
    session_id_ = INVALID_SESSION;
    fail_all(TabError::Transport, "disconnected");
}

bool SocketChannel::poll(int timeout_ms)
{
    if (!connected())
        return false;

    int wait = timeout_ms;
    while (conn_ && conn_->wait_readable(wait))
    {
        Message    msg;
        ReadStatus status = conn_->read(msg);
        if (status != ReadStatus::Frame)
        {
            if (status == ReadStatus::Rejected)
                TABSYNC_LOG_ERROR("ipc", "authority sent an invalid frame");
            connection_lost();
            return false;
        }
        handle_message(msg);
        wait = 0;   // drain whatever else is already buffered
    }
    return connected();
}

void SocketChannel::handle_message(const Message& msg)
{
    switch (msg.header.type)
    {
        case MessageType::CMD_RESPONSE:
        {
            auto resp = decode_response(msg.payload);
            if (!resp)
            {
                complete(msg.header.request_id,
                         CommandResponse::failure(TabError::Malformed, "undecodable response"));
                break;
            }
            complete(msg.header.request_id, std::move(*resp));
            break;
        }
        case MessageType::PUSH_SNAPSHOT:
        {
            auto snap = decode_snapshot(msg.payload);
            if (!snap)
            {
                TABSYNC_LOG_WARN("ipc", "ignoring malformed snapshot push ({} bytes)", msg.payload.size());
                break;
            }
            std::weak_ptr<bool> alive = alive_;
            loop_.post(
                [this, alive, pushed = std::move(*snap)]
                {
                    auto token = alive.lock();
                    if (!token || !*token)
                        return;
                    auto handlers = subscribers_;
                    for (auto& [id, handler] : handlers)
                    {
                        if (handler)
                            handler(pushed);
                    }
                });
            break;
        }
        case MessageType::BYE:
            TABSYNC_LOG_INFO("ipc", "authority closed the session");
            connection_lost();
            break;
        default:
            TABSYNC_LOG_DEBUG("ipc", "ignoring message type {}", static_cast<uint16_t>(msg.header.type));
            break;
    }
}

RequestId SocketChannel::send_command(const Command& cmd)
{
    if (!connected())
        return INVALID_REQUEST;

    RequestId id = next_request_id_++;
    if (!conn_->send(MessageType::CMD_REQUEST, session_id_, id, encode_command(cmd)))
        return INVALID_REQUEST;
    return id;
}

void SocketChannel::send(const Command& cmd)
{
    if (send_command(cmd) == INVALID_REQUEST)
        TABSYNC_LOG_WARN("ipc", "dropping {} command: not connected", command_type_to_string(cmd.type));
}

void SocketChannel::invoke(const Command& cmd, ResponseHandler handler)
{
    RequestId id = send_command(cmd);
    if (id == INVALID_REQUEST)
    {
        if (handler)
        {
            loop_.post([handler = std::move(handler)]
                       { handler(CommandResponse::failure(TabError::Transport, "authority unreachable")); });
        }
        if (conn_)
            connection_lost();
        return;
    }

    Pending pending;
    pending.handler       = std::move(handler);
    pending.timeout_timer = loop_.schedule(
        invoke_timeout_,
        [this, id]
        {
            auto it = pending_.find(id);
            if (it == pending_.end())
                return;
            it->second.timeout_timer = EventLoop::INVALID_TIMER;
            TABSYNC_LOG_WARN("ipc", "request {} timed out after {} ms", id, invoke_timeout_.count());
            complete(id, CommandResponse::failure(TabError::Timeout, "no response from authority"));
        });
    pending_.emplace(id, std::move(pending));
}

void SocketChannel::complete(RequestId id, CommandResponse response)
{
    auto it = pending_.find(id);
    if (it == pending_.end())
    {
        TABSYNC_LOG_DEBUG("ipc", "dropping response for unknown or expired request {}", id);
        return;
    }

    Pending pending = std::move(it->second);
    pending_.erase(it);
    if (pending.timeout_timer != EventLoop::INVALID_TIMER)
        loop_.cancel(pending.timeout_timer);

    if (pending.handler)
    {
        loop_.post([handler = std::move(pending.handler), response = std::move(response)]
                   { handler(response); });
    }
}

void SocketChannel::fail_all(TabError error, const std::string& detail)
{
    std::vector<RequestId> ids;
    ids.reserve(pending_.size());
    for (const auto& [id, pending] : pending_)
        ids.push_back(id);
    for (auto id : ids)
        complete(id, CommandResponse::failure(error, detail));
}

void SocketChannel::connection_lost()
{
    if (conn_)
    {
        conn_->close();
        conn_.reset();
        TABSYNC_LOG_WARN("ipc", "connection to authority lost ({} requests pending)", pending_.size());
    }
    session_id_ = INVALID_SESSION;
    fail_all(TabError::Transport, "connection lost");
}

AuthorityChannel::SubscriptionId SocketChannel::subscribe(PushHandler handler)
{
    SubscriptionId id = next_subscription_++;
    subscribers_.emplace(id, std::move(handler));
    return id;
}

void SocketChannel::unsubscribe(SubscriptionId id)
{
    subscribers_.erase(id);
}

}   // namespace tabsync::ipc
