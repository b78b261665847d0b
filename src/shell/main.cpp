#include "shell_session.hpp"

#include "../core/config.hpp"
#include "../daemon/tab_registry.hpp"
#include "../ipc/inproc_channel.hpp"
#include "../ipc/socket_channel.hpp"
#include "../ipc/transport.hpp"

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <tabsync/logger.hpp>

using namespace tabsync;

namespace
{

void print_usage()
{
    std::fprintf(stderr,
                 "usage: tabsync-shell [--inproc] [--config <path>] [--socket <path>] "
                 "[--log-level <level>]\n");
}

int run_session(ShellSession& session)
{
    session.settle();
    session.print_tabs();

    std::string line;
    while (true)
    {
        std::cout << "tabsync> " << std::flush;
        if (!std::getline(std::cin, line))
            break;
        if (!session.execute(line))
            break;
    }
    return 0;
}

}   // namespace

int main(int argc, char* argv[])
{
    auto cli = parse_command_line(argc, argv);
    if (!cli.ok())
    {
        std::fprintf(stderr, "tabsync-shell: %s\n", cli.error.c_str());
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

    EventLoop loop;

    if (config.inproc)
    {
        TABSYNC_LOG_INFO("shell", "running with an in-process authority");

        daemon::TabRegistry registry(config.max_tabs);
        if (!config.home_url.empty())
        {
            CreateOptions home;
            home.pinned = true;
            auto created = registry.create(config.home_url, home);
            if (!created.ok())
                TABSYNC_LOG_WARN("shell", "no home tab: {}", created.message());
        }

        ipc::InProcChannel channel(loop, registry, std::chrono::milliseconds(config.push_debounce_ms));
        ShellSession       session(loop, channel, config, std::cout);
        channel.push_now(SnapshotReason::Routine);
        return run_session(session);
    }

    std::string socket_path = config.socket_path.empty() ? ipc::default_socket_path() : config.socket_path;

    ipc::SocketChannel channel(loop, std::chrono::milliseconds(config.invoke_timeout_ms));
    if (!channel.connect(socket_path))
    {
        TABSYNC_LOG_ERROR("shell", "cannot reach the authority at {}", socket_path);
        return 1;
    }
    TABSYNC_LOG_INFO("shell", "connected to {} as session {}", socket_path, channel.session_id());

    int rc = 0;
    {
        ShellSession session(loop, channel, config, std::cout);
        session.set_transport_pump([&channel](int timeout_ms) { return channel.poll(timeout_ms); });

        // Give the initial snapshot a moment to arrive.
        session.settle(std::chrono::milliseconds(50));
        rc = run_session(session);
    }
    channel.disconnect();
    return rc;
}
