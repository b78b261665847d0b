#include <gtest/gtest.h>

#include "daemon/command_dispatcher.hpp"
#include "daemon/tab_registry.hpp"
#include "ipc/codec.hpp"
#include "ipc/socket_channel.hpp"
#include "ipc/transport.hpp"
#include "ui/replica_store.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <unistd.h>

using namespace tabsync;
using namespace tabsync::ipc;

namespace
{

std::string test_socket(const char* name)
{
    return "/tmp/tabsync-chan-" + std::string(name) + "-" + std::to_string(::getpid()) + ".sock";
}

// Minimal single-session authority running on its own thread: answers the
// handshake, pushes the initial snapshot and then serves commands until the
// peer says BYE or `answer_commands` is false (then it stays silent).
class ThreadedAuthority
{
   public:
    ThreadedAuthority(const std::string& path, bool answer_commands = true) : answer_(answer_commands)
    {
        CreateOptions home;
        home.pinned = true;
        registry_.create("tabsync://home", home);
        registry_.create("https://b.test/");
        listening_ = server_.listen(path);
        if (listening_)
            thread_ = std::thread([this] { run(); });
    }

    ~ThreadedAuthority()
    {
        stop_ = true;
        if (thread_.joinable())
            thread_.join();
        server_.close();
    }

    bool listening() const { return listening_; }

    std::atomic<int> commands_seen{0};

   private:
    void run()
    {
        std::unique_ptr<Connection> conn;
        while (!stop_ && !conn)
        {
            conn = server_.accept_pending();
            if (!conn)
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (!conn)
            return;

        daemon::CommandDispatcher dispatcher(registry_);
        while (!stop_)
        {
            if (!conn->wait_readable(5))
                continue;
            Message msg;
            if (conn->read(msg) != ReadStatus::Frame)
                return;
            switch (msg.header.type)
            {
                case MessageType::HELLO:
                {
                    WelcomePayload wp;
                    wp.session_id = 7;
                    conn->send(MessageType::WELCOME, 7, msg.header.request_id, encode_welcome(wp));
                    conn->send(MessageType::PUSH_SNAPSHOT,
                               7,
                               INVALID_REQUEST,
                               encode_snapshot(registry_.snapshot(SnapshotReason::Routine)));
                    break;
                }
                case MessageType::CMD_REQUEST:
                {
                    ++commands_seen;
                    if (!answer_)
                        break;
                    auto outcome = dispatcher.dispatch_payload(msg.payload);
                    conn->send(MessageType::CMD_RESPONSE,
                               7,
                               msg.header.request_id,
                               encode_response(outcome.response));
                    if (outcome.response.success)
                    {
                        conn->send(MessageType::PUSH_SNAPSHOT,
                                   7,
                                   INVALID_REQUEST,
                                   encode_snapshot(registry_.snapshot(SnapshotReason::Immediate)));
                    }
                    break;
                }
                case MessageType::BYE:
                    return;
                default:
                    break;
            }
        }
    }

    daemon::TabRegistry registry_;
    Listener            server_;
    bool                listening_ = false;
    bool                answer_;
    std::atomic<bool>   stop_{false};
    std::thread         thread_;
};

// Pump the channel and the loop until `done` or the time runs out.
template <typename Pred>
bool pump_until(SocketChannel& channel, EventLoop& loop, Pred done, std::chrono::milliseconds limit)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        channel.poll(5);
        loop.run_until_idle();
        if (done())
            return true;
    }
    return false;
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Handshake and pushes
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SocketChannel, ConnectFailsWithoutAuthority)
{
    EventLoop     loop;
    SocketChannel channel(loop);
    EXPECT_FALSE(channel.connect(test_socket("absent")));
    EXPECT_FALSE(channel.connected());
}

TEST(SocketChannel, HandshakeAndInitialSnapshot)
{
    auto              path = test_socket("hs");
    ThreadedAuthority authority(path);
    ASSERT_TRUE(authority.listening());

    EventLoop     loop;
    SocketChannel channel(loop);
    ASSERT_TRUE(channel.connect(path));
    EXPECT_EQ(channel.session_id(), 7u);

    std::vector<Snapshot> pushes;
    channel.subscribe([&](const Snapshot& s) { pushes.push_back(s); });

    ASSERT_TRUE(pump_until(channel, loop, [&] { return !pushes.empty(); }, std::chrono::milliseconds(2000)));
    EXPECT_EQ(pushes[0].reason, SnapshotReason::Routine);
    EXPECT_EQ(pushes[0].state.size(), 2u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Request/response
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SocketChannel, InvokeGetsResponseThenImmediateSnapshot)
{
    auto              path = test_socket("invoke");
    ThreadedAuthority authority(path);
    ASSERT_TRUE(authority.listening());

    EventLoop     loop;
    SocketChannel channel(loop);
    ASSERT_TRUE(channel.connect(path));

    ReplicaStore store(loop, channel);
    store.attach();
    ASSERT_TRUE(pump_until(channel, loop, [&] { return store.state().size() == 2; }, std::chrono::milliseconds(2000)));

    std::optional<CommandResponse> response;
    channel.invoke(Command::create("https://c.test/"), [&](const CommandResponse& r) { response = r; });
    EXPECT_EQ(channel.pending_requests(), 1u);

    ASSERT_TRUE(pump_until(channel, loop, [&] { return response && store.state().size() == 3; },
                           std::chrono::milliseconds(2000)));
    EXPECT_TRUE(response->success);
    EXPECT_FALSE(response->data.empty());
    EXPECT_EQ(store.state().active_id, response->data);
    EXPECT_EQ(channel.pending_requests(), 0u);
}

TEST(SocketChannel, FailedCommandCarriesError)
{
    auto              path = test_socket("fail");
    ThreadedAuthority authority(path);
    ASSERT_TRUE(authority.listening());

    EventLoop     loop;
    SocketChannel channel(loop);
    ASSERT_TRUE(channel.connect(path));

    std::optional<CommandResponse> response;
    channel.invoke(Command::close("ghost"), [&](const CommandResponse& r) { response = r; });
    ASSERT_TRUE(pump_until(channel, loop, [&] { return response.has_value(); }, std::chrono::milliseconds(2000)));
    EXPECT_FALSE(response->success);
    EXPECT_EQ(response->error_code(), TabError::NotFound);
}

TEST(SocketChannel, SilentAuthorityTimesOut)
{
    auto              path = test_socket("timeout");
    ThreadedAuthority authority(path, false);
    ASSERT_TRUE(authority.listening());

    EventLoop     loop;
    SocketChannel channel(loop, std::chrono::milliseconds(50));
    ASSERT_TRUE(channel.connect(path));

    std::optional<CommandResponse> response;
    channel.invoke(Command::switch_to("x"), [&](const CommandResponse& r) { response = r; });
    ASSERT_TRUE(pump_until(channel, loop, [&] { return response.has_value(); }, std::chrono::milliseconds(2000)));
    EXPECT_EQ(response->error_code(), TabError::Timeout);
    EXPECT_EQ(channel.pending_requests(), 0u);
}

TEST(SocketChannel, DisconnectFailsPendingRequests)
{
    auto              path = test_socket("bye");
    ThreadedAuthority authority(path, false);
    ASSERT_TRUE(authority.listening());

    EventLoop     loop;
    SocketChannel channel(loop);
    ASSERT_TRUE(channel.connect(path));

    std::optional<CommandResponse> response;
    channel.invoke(Command::switch_to("x"), [&](const CommandResponse& r) { response = r; });
    channel.disconnect();
    loop.run_until_idle();

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->error_code(), TabError::Transport);
    EXPECT_FALSE(channel.connected());
}

TEST(SocketChannel, InvokeWhileDisconnectedFailsAsynchronously)
{
    EventLoop     loop;
    SocketChannel channel(loop);

    bool called = false;
    channel.invoke(Command::switch_to("x"),
                   [&](const CommandResponse& r)
                   {
                       called = true;
                       EXPECT_EQ(r.error_code(), TabError::Transport);
                   });
    EXPECT_FALSE(called);
    loop.run_until_idle();
    EXPECT_TRUE(called);
}
