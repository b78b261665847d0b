#include "command_dispatcher.hpp"

#include <tabsync/logger.hpp>

#include "../ipc/codec.hpp"

namespace tabsync::daemon
{

namespace
{

ipc::CommandResponse to_response(const Status& status)
{
    if (status.ok())
        return ipc::CommandResponse::ok();
    return ipc::CommandResponse::failure(status.error(), status.message());
}

ipc::CommandResponse to_response(const Result<TabId>& result)
{
    if (result.ok())
        return ipc::CommandResponse::ok(result.value());
    return ipc::CommandResponse::failure(result.error(), result.message());
}

ipc::CommandResponse to_response(const Result<size_t>& result)
{
    if (result.ok())
        return ipc::CommandResponse::ok(std::to_string(result.value()));
    return ipc::CommandResponse::failure(result.error(), result.message());
}

// Created ids, comma-separated in creation order.
ipc::CommandResponse to_response(const Result<std::vector<TabId>>& result)
{
    if (!result.ok())
        return ipc::CommandResponse::failure(result.error(), result.message());
    std::string ids;
    for (const auto& id : result.value())
    {
        if (!ids.empty())
            ids += ',';
        ids += id;
    }
    return ipc::CommandResponse::ok(std::move(ids));
}

}   // namespace

CommandDispatcher::CommandDispatcher(TabRegistry& registry) : registry_(registry) {}

CommandDispatcher::Outcome CommandDispatcher::dispatch(const ipc::Command& cmd)
{
    ++dispatched_;
    const uint64_t before = registry_.revision();

    Outcome out;
    out.response      = execute(cmd);
    out.state_changed = registry_.revision() != before;

    if (!out.response.success)
    {
        ++failed_;
        TABSYNC_LOG_WARN("daemon",
                         "{} {} failed: {}",
                         ipc::command_type_to_string(cmd.type),
                         cmd.tab_id,
                         out.response.error);
    }
    else
    {
        TABSYNC_LOG_DEBUG("daemon",
                          "{} {} ok (revision {})",
                          ipc::command_type_to_string(cmd.type),
                          cmd.tab_id,
                          registry_.revision());
    }
    return out;
}

CommandDispatcher::Outcome CommandDispatcher::dispatch_payload(std::span<const uint8_t> payload)
{
    auto cmd = ipc::decode_command(payload);
    if (!cmd)
    {
        ++dispatched_;
        ++failed_;
        TABSYNC_LOG_WARN("daemon", "malformed command payload ({} bytes)", payload.size());
        Outcome out;
        out.response = ipc::CommandResponse::failure(TabError::Malformed, "undecodable command");
        return out;
    }
    return dispatch(*cmd);
}

ipc::CommandResponse CommandDispatcher::execute(const ipc::Command& cmd)
{
    switch (cmd.type)
    {
        case ipc::CommandType::Create:
            return to_response(registry_.create(cmd.url, cmd.options));
        case ipc::CommandType::Close:
            return to_response(registry_.close(cmd.tab_id));
        case ipc::CommandType::Switch:
            return to_response(registry_.switch_active(cmd.tab_id));
        case ipc::CommandType::Reorder:
            return to_response(registry_.reorder(cmd.tab_id, cmd.target_index));
        case ipc::CommandType::UpdateTitle:
            return to_response(registry_.update_title(cmd.tab_id, cmd.title));
        case ipc::CommandType::SetLoading:
            return to_response(registry_.set_loading(cmd.tab_id, cmd.loading));
        case ipc::CommandType::CloseOthers:
            return to_response(registry_.close_others(cmd.tab_id));
        case ipc::CommandType::Duplicate:
            return to_response(registry_.duplicate(cmd.tab_id));
        case ipc::CommandType::CloseAll:
            return to_response(registry_.close_all());
        case ipc::CommandType::CreateBatch:
            return to_response(registry_.create_batch(cmd.urls));
        case ipc::CommandType::GetStats:
            return ipc::CommandResponse::ok(stats_to_string(registry_.stats()));
    }
    return ipc::CommandResponse::failure(TabError::Malformed, "unknown command type");
}

}   // namespace tabsync::daemon
