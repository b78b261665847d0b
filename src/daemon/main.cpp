#include "command_dispatcher.hpp"
#include "push_debouncer.hpp"
#include "tab_registry.hpp"

#include "../core/config.hpp"
#include "../ipc/codec.hpp"
#include "../ipc/message.hpp"
#include "../ipc/transport.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <poll.h>
#include <string>
#include <tabsync/logger.hpp>
#include <vector>

using namespace tabsync;

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

void print_usage()
{
    std::fprintf(stderr,
                 "usage: tabsync-authority [--config <path>] [--socket <path>] [--log-level <level>]\n");
}

struct ClientSlot
{
    std::unique_ptr<ipc::Connection> conn;
    ipc::SessionId                   session_id     = ipc::INVALID_SESSION;
    bool                             handshake_done = false;
    std::string                      name;
};

// Helper: send a PUSH_SNAPSHOT to one client.
bool send_snapshot(ClientSlot& client, const Snapshot& snap)
{
    return client.conn->send(ipc::MessageType::PUSH_SNAPSHOT,
                             client.session_id,
                             ipc::INVALID_REQUEST,
                             ipc::encode_snapshot(snap));
}

ClientSlot* find_session(std::vector<ClientSlot>& clients, ipc::SessionId sid)
{
    for (auto& c : clients)
    {
        if (c.session_id == sid && c.conn && c.conn->is_open())
            return &c;
    }
    return nullptr;
}

}   // namespace

int main(int argc, char* argv[])
{
    auto cli = parse_command_line(argc, argv);
    if (!cli.ok())
    {
        std::fprintf(stderr, "tabsync-authority: %s\n", cli.error.c_str());
        print_usage();
        return 2;
    }
    if (cli.show_help)
    {
        print_usage();
        return 0;
    }

    TabsyncConfig config = resolve_config(cli);
    apply_logging(config);

    std::string socket_path = config.socket_path.empty() ? ipc::default_socket_path() : config.socket_path;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    TABSYNC_LOG_INFO("daemon", "starting authority, socket: {}", socket_path);

    // --- Start UDS listener ---
    ipc::Listener listener;
    if (!listener.listen(socket_path))
    {
        TABSYNC_LOG_CRITICAL("daemon", "failed to listen on {}", socket_path);
        return 1;
    }

    daemon::TabRegistry       registry(config.max_tabs);
    daemon::CommandDispatcher dispatcher(registry);
    daemon::PushDebouncer     debouncer(std::chrono::milliseconds(config.push_debounce_ms));

    if (!config.home_url.empty())
    {
        CreateOptions home;
        home.pinned = true;
        auto created = registry.create(config.home_url, home);
        if (!created.ok())
            TABSYNC_LOG_WARN("daemon", "no home tab: {}", created.message());
    }

    std::vector<ClientSlot> clients;
    ipc::SessionId          next_session = 1;

    // Fan a routine push out to every session except `issuer`.
    auto queue_routine = [&](ipc::SessionId issuer)
    {
        auto now = daemon::PushDebouncer::Clock::now();
        for (auto& c : clients)
        {
            if (c.handshake_done && c.session_id != issuer)
                debouncer.request_routine(c.session_id, now);
        }
    };

    TABSYNC_LOG_INFO("daemon", "listening for connections");

    // --- Poll-based multiplexed event loop ---
    // poll() watches the listen fd + all client fds; its timeout is capped by
    // the next debounced push so routine snapshots go out on time.
    while (g_running.load(std::memory_order_relaxed))
    {
        std::vector<struct pollfd> pfds;
        pfds.reserve(1 + clients.size());
        pfds.push_back({listener.fd(), POLLIN, 0});
        for (auto& c : clients)
            pfds.push_back({c.conn ? c.conn->fd() : -1, POLLIN, 0});

        int timeout_ms = 100;
        if (auto due = debouncer.next_due())
        {
            auto wait = std::chrono::ceil<std::chrono::milliseconds>(*due - daemon::PushDebouncer::Clock::now());
            timeout_ms = static_cast<int>(std::clamp<int64_t>(wait.count(), 0, timeout_ms));
        }

        int poll_ret = ::poll(pfds.data(), static_cast<nfds_t>(pfds.size()), timeout_ms);
        if (poll_ret < 0)
        {
            if (errno == EINTR)
                continue;
            TABSYNC_LOG_CRITICAL("daemon", "poll() failed, errno {}", errno);
            break;
        }

        // Accept new connections
        if (pfds[0].revents & POLLIN)
        {
            auto new_conn = listener.accept_pending();
            if (new_conn)
            {
                TABSYNC_LOG_DEBUG("daemon", "new connection (fd={})", new_conn->fd());
                ClientSlot slot;
                slot.conn = std::move(new_conn);
                clients.push_back(std::move(slot));
            }
        }

        // Process messages from all connected clients. New slots appended
        // above have no pollfd entry this round.
        const size_t polled = pfds.size() - 1;
        for (size_t i = 0; i < clients.size() && i < polled; ++i)
        {
            auto& client = clients[i];
            if (!client.conn || !client.conn->is_open())
                continue;
            if (!(pfds[1 + i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;

            ipc::Message    msg;
            ipc::ReadStatus status = client.conn->read(msg);
            if (status != ipc::ReadStatus::Frame)
            {
                if (status == ipc::ReadStatus::Rejected)
                    TABSYNC_LOG_WARN("daemon", "session {} sent an invalid frame, dropping it", client.session_id);
                else
                    TABSYNC_LOG_INFO("daemon", "session {} disconnected", client.session_id);
                client.conn->close();
                continue;
            }

            switch (msg.header.type)
            {
                case ipc::MessageType::HELLO:
                {
                    auto hello = ipc::decode_hello(msg.payload);
                    if (!hello || hello->protocol_major != ipc::PROTOCOL_MAJOR)
                    {
                        TABSYNC_LOG_WARN("daemon", "rejecting client with bad HELLO");
                        client.conn->close();
                        break;
                    }

                    client.session_id     = next_session++;
                    client.handshake_done = true;
                    client.name           = hello->client_name;

                    ipc::WelcomePayload wp;
                    wp.session_id       = client.session_id;
                    wp.push_debounce_ms = config.push_debounce_ms;
                    if (!client.conn->send(ipc::MessageType::WELCOME,
                                           client.session_id,
                                           msg.header.request_id,
                                           ipc::encode_welcome(wp)))
                    {
                        client.conn->close();
                        break;
                    }

                    TABSYNC_LOG_INFO("daemon", "HELLO from {} -> session {}", client.name, client.session_id);

                    // New sessions start from the current state.
                    if (!send_snapshot(client, registry.snapshot(SnapshotReason::Routine)))
                        client.conn->close();
                    break;
                }

                case ipc::MessageType::CMD_REQUEST:
                {
                    if (!client.handshake_done)
                    {
                        TABSYNC_LOG_WARN("daemon", "command before handshake, dropping client");
                        client.conn->close();
                        break;
                    }

                    auto outcome = dispatcher.dispatch_payload(msg.payload);
                    if (!client.conn->send(ipc::MessageType::CMD_RESPONSE,
                                           client.session_id,
                                           msg.header.request_id,
                                           ipc::encode_response(outcome.response)))
                    {
                        client.conn->close();
                        break;
                    }

                    if (outcome.response.success)
                    {
                        debouncer.note_immediate(client.session_id);
                        if (!send_snapshot(client, registry.snapshot(SnapshotReason::Immediate)))
                            client.conn->close();
                    }
                    if (outcome.state_changed)
                        queue_routine(client.session_id);
                    break;
                }

                case ipc::MessageType::BYE:
                    TABSYNC_LOG_INFO("daemon", "BYE from session {}", client.session_id);
                    client.conn->close();
                    break;

                default:
                    TABSYNC_LOG_DEBUG("daemon",
                                      "ignoring message type {} from session {}",
                                      static_cast<uint16_t>(msg.header.type),
                                      client.session_id);
                    break;
            }
        }

        // Drop closed sessions
        for (auto it = clients.begin(); it != clients.end();)
        {
            if (!it->conn || !it->conn->is_open())
            {
                debouncer.remove_session(it->session_id);
                it = clients.erase(it);
            }
            else
            {
                ++it;
            }
        }

        // Flush debounced routine pushes
        for (auto sid : debouncer.collect_due(daemon::PushDebouncer::Clock::now()))
        {
            ClientSlot* client = find_session(clients, sid);
            if (!client)
                continue;
            if (!send_snapshot(*client, registry.snapshot(SnapshotReason::Routine)))
            {
                TABSYNC_LOG_WARN("daemon", "routine push to session {} failed", sid);
                client->conn->close();
            }
        }
    }

    TABSYNC_LOG_INFO("daemon", "shutting down ({} sessions)", clients.size());
    for (auto& c : clients)
    {
        if (c.conn && c.conn->is_open() && c.handshake_done)
        {
            if (!c.conn->send(ipc::MessageType::BYE, c.session_id, ipc::INVALID_REQUEST, {}))
                TABSYNC_LOG_DEBUG("daemon", "BYE to session {} not delivered", c.session_id);
        }
    }
    listener.close();
    return 0;
}
