#include "message.hpp"

namespace tabsync::ipc
{

bool is_known_message_type(uint16_t raw)
{
    switch (static_cast<MessageType>(raw))
    {
        case MessageType::HELLO:
        case MessageType::WELCOME:
        case MessageType::BYE:
        case MessageType::CMD_REQUEST:
        case MessageType::CMD_RESPONSE:
        case MessageType::PUSH_SNAPSHOT:
            return true;
    }
    return false;
}

std::string_view command_type_to_string(CommandType type)
{
    switch (type)
    {
        case CommandType::Create:
            return "create";
        case CommandType::Close:
            return "close";
        case CommandType::Switch:
            return "switch";
        case CommandType::Reorder:
            return "reorder";
        case CommandType::UpdateTitle:
            return "update_title";
        case CommandType::SetLoading:
            return "set_loading";
        case CommandType::CloseOthers:
            return "close_others";
        case CommandType::Duplicate:
            return "duplicate";
        case CommandType::CloseAll:
            return "close_all";
        case CommandType::CreateBatch:
            return "create_batch";
        case CommandType::GetStats:
            return "get_stats";
    }
    return "unknown";
}

std::optional<CommandType> command_type_from_string(std::string_view name)
{
    for (uint8_t raw = 1; raw <= static_cast<uint8_t>(CommandType::GetStats); ++raw)
    {
        auto type = static_cast<CommandType>(raw);
        if (command_type_to_string(type) == name)
            return type;
    }
    return std::nullopt;
}

Command Command::create(std::string url, CreateOptions options)
{
    Command cmd;
    cmd.type    = CommandType::Create;
    cmd.url     = std::move(url);
    cmd.options = std::move(options);
    return cmd;
}

Command Command::close(TabId id)
{
    Command cmd;
    cmd.type   = CommandType::Close;
    cmd.tab_id = std::move(id);
    return cmd;
}

Command Command::switch_to(TabId id)
{
    Command cmd;
    cmd.type   = CommandType::Switch;
    cmd.tab_id = std::move(id);
    return cmd;
}

Command Command::reorder(TabId id, uint32_t target_index)
{
    Command cmd;
    cmd.type         = CommandType::Reorder;
    cmd.tab_id       = std::move(id);
    cmd.target_index = target_index;
    return cmd;
}

Command Command::update_title(TabId id, std::string title)
{
    Command cmd;
    cmd.type   = CommandType::UpdateTitle;
    cmd.tab_id = std::move(id);
    cmd.title  = std::move(title);
    return cmd;
}

Command Command::set_loading(TabId id, bool loading)
{
    Command cmd;
    cmd.type    = CommandType::SetLoading;
    cmd.tab_id  = std::move(id);
    cmd.loading = loading;
    return cmd;
}

Command Command::close_others(TabId keep_id)
{
    Command cmd;
    cmd.type   = CommandType::CloseOthers;
    cmd.tab_id = std::move(keep_id);
    return cmd;
}

Command Command::duplicate(TabId id)
{
    Command cmd;
    cmd.type   = CommandType::Duplicate;
    cmd.tab_id = std::move(id);
    return cmd;
}

Command Command::close_all()
{
    Command cmd;
    cmd.type = CommandType::CloseAll;
    return cmd;
}

Command Command::create_batch(std::vector<std::string> urls)
{
    Command cmd;
    cmd.type = CommandType::CreateBatch;
    cmd.urls = std::move(urls);
    return cmd;
}

Command Command::get_stats()
{
    Command cmd;
    cmd.type = CommandType::GetStats;
    return cmd;
}

CommandResponse CommandResponse::ok(std::string data)
{
    CommandResponse resp;
    resp.success = true;
    resp.data    = std::move(data);
    return resp;
}

CommandResponse CommandResponse::failure(TabError error, std::string_view detail)
{
    CommandResponse resp;
    resp.success = false;
    resp.error   = std::string(error_to_string(error));
    if (!detail.empty())
    {
        resp.error += ": ";
        resp.error += detail;
    }
    return resp;
}

TabError CommandResponse::error_code() const
{
    if (success)
        return TabError::None;
    auto name = std::string_view(error).substr(0, error.find(':'));
    return error_from_string(name).value_or(TabError::Malformed);
}

}   // namespace tabsync::ipc
