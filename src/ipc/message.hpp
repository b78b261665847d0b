#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/tab_state.hpp"

namespace tabsync::ipc
{

// ─── IPC ID types ────────────────────────────────────────────────────────────
using SessionId = uint64_t;
using RequestId = uint64_t;

static constexpr SessionId INVALID_SESSION = 0;
static constexpr RequestId INVALID_REQUEST = 0;

// ─── Message types ───────────────────────────────────────────────────────────
enum class MessageType : uint16_t
{
    // Handshake
    HELLO         = 0x0001,
    WELCOME       = 0x0002,
    BYE           = 0x0003,

    // Request/Response (UI → Authority → UI)
    CMD_REQUEST   = 0x0100,
    CMD_RESPONSE  = 0x0101,

    // Push (Authority → UI)
    PUSH_SNAPSHOT = 0x0200,
};

// True for the raw header values listed in MessageType.
bool is_known_message_type(uint16_t raw);

// ─── Message envelope ────────────────────────────────────────────────────────
// Wire format: [Header (fixed 40 bytes)] [payload (variable)]
//
// Header layout:
//   bytes 0-1:   magic (0x54, 0x53 = "TS")
//   bytes 2-3:   message type (uint16_t LE)
//   bytes 4-7:   payload length (uint32_t LE)
//   bytes 8-15:  sequence number (uint64_t LE)
//   bytes 16-23: request_id (uint64_t LE)
//   bytes 24-31: session_id (uint64_t LE)
//   bytes 32-39: reserved, written as zero

static constexpr uint8_t MAGIC_0          = 0x54;   // 'T'
static constexpr uint8_t MAGIC_1          = 0x53;   // 'S'
static constexpr size_t  HEADER_SIZE      = 40;
static constexpr size_t  MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;   // 16 MiB

struct MessageHeader
{
    MessageType type        = MessageType::HELLO;
    uint32_t    payload_len = 0;
    uint64_t    seq         = 0;
    RequestId   request_id  = INVALID_REQUEST;
    SessionId   session_id  = INVALID_SESSION;
};

struct Message
{
    MessageHeader        header;
    std::vector<uint8_t> payload;
};

// ─── Handshake payloads ──────────────────────────────────────────────────────

static constexpr uint16_t PROTOCOL_MAJOR = 1;
static constexpr uint16_t PROTOCOL_MINOR = 0;

struct HelloPayload
{
    uint16_t    protocol_major = PROTOCOL_MAJOR;
    uint16_t    protocol_minor = PROTOCOL_MINOR;
    std::string client_name;
};

struct WelcomePayload
{
    SessionId session_id       = INVALID_SESSION;
    uint32_t  push_debounce_ms = 100;
};

// ─── Commands (UI → Authority) ───────────────────────────────────────────────

enum class CommandType : uint8_t
{
    Create      = 1,
    Close       = 2,
    Switch      = 3,
    Reorder     = 4,
    UpdateTitle = 5,
    SetLoading  = 6,
    CloseOthers = 7,
    Duplicate   = 8,
    CloseAll    = 9,
    CreateBatch = 10,
    GetStats    = 11,
};

std::string_view           command_type_to_string(CommandType type);
std::optional<CommandType> command_type_from_string(std::string_view name);

// One struct for every command; fields not used by `type` stay default.
struct Command
{
    CommandType   type = CommandType::Switch;
    TabId         tab_id;         // close, switch, reorder, update_title, set_loading, ...
    std::string   url;            // create
    CreateOptions options;        // create
    uint32_t      target_index = 0;   // reorder
    std::string   title;          // update_title
    bool          loading = false;    // set_loading
    std::vector<std::string> urls;    // create_batch

    static Command create(std::string url, CreateOptions options = {});
    static Command close(TabId id);
    static Command switch_to(TabId id);
    static Command reorder(TabId id, uint32_t target_index);
    static Command update_title(TabId id, std::string title);
    static Command set_loading(TabId id, bool loading);
    static Command close_others(TabId keep_id);
    static Command duplicate(TabId id);
    static Command close_all();
    static Command create_batch(std::vector<std::string> urls);
    static Command get_stats();
};

// { success, error?, data? }
struct CommandResponse
{
    bool        success = false;
    std::string error;   // TabError name when !success
    std::string data;    // created tab id(s), closed count, tab counts

    static CommandResponse ok(std::string data = {});
    static CommandResponse failure(TabError error, std::string_view detail = {});

    // Error code parsed from `error`, TabError::None on success.
    TabError error_code() const;
};

// ─── Push (Authority → UI) ───────────────────────────────────────────────────
// { type: "snapshot", tabs, order, activeId, reason }, carried as a
// PUSH_SNAPSHOT message whose payload encodes a Snapshot.

}   // namespace tabsync::ipc
