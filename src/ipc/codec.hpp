#pragma once

#include "message.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tabsync::ipc
{

// ─── Header serialization ────────────────────────────────────────────────────
// Encodes/decodes the fixed 40-byte message header.

// Encode header into exactly HEADER_SIZE bytes (appended to `out`).
void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out);

// Decode header from exactly HEADER_SIZE bytes.
// Returns std::nullopt if magic bytes are wrong or buffer too small.
std::optional<MessageHeader> decode_header(std::span<const uint8_t> data);

// ─── Full message serialization ──────────────────────────────────────────────

std::vector<uint8_t>   encode_message(const Message& msg);
std::optional<Message> decode_message(std::span<const uint8_t> data);

// ─── Payload serialization (TLV) ─────────────────────────────────────────────
// Each field: [tag: uint8_t] [len: uint32_t LE] [data: len bytes]

class PayloadEncoder
{
   public:
    void put_u8(uint8_t tag, uint8_t val);
    void put_u16(uint8_t tag, uint16_t val);
    void put_u32(uint8_t tag, uint32_t val);
    void put_u64(uint8_t tag, uint64_t val);
    void put_bool(uint8_t tag, bool val) { put_u8(tag, val ? 1 : 0); }
    void put_string(uint8_t tag, const std::string& val);
    void put_blob(uint8_t tag, const std::vector<uint8_t>& blob);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

   private:
    std::vector<uint8_t> buf_;
};

class PayloadDecoder
{
   public:
    explicit PayloadDecoder(std::span<const uint8_t> data);

    // Advance to the next field. Returns false when no more fields, or when
    // the remaining bytes do not form a complete field (see malformed()).
    bool next();

    uint8_t  tag() const { return tag_; }
    uint32_t field_len() const { return len_; }

    // True once next() stopped on a truncated field rather than clean EOF.
    bool malformed() const { return malformed_; }

    // Width-checked reads: a field shorter than the type reads as 0.
    uint8_t                  as_u8() const;
    uint16_t                 as_u16() const;
    uint32_t                 as_u32() const;
    uint64_t                 as_u64() const;
    bool                     as_bool() const { return as_u8() != 0; }
    std::string              as_string() const;
    std::span<const uint8_t> as_blob() const;

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_        = 0;
    uint8_t                  tag_        = 0;
    uint32_t                 len_        = 0;
    size_t                   val_offset_ = 0;
    bool                     malformed_  = false;
};

// ─── Field tags ──────────────────────────────────────────────────────────────

// Handshake
static constexpr uint8_t TAG_PROTOCOL_MAJOR = 0x10;
static constexpr uint8_t TAG_PROTOCOL_MINOR = 0x11;
static constexpr uint8_t TAG_CLIENT_NAME    = 0x12;
static constexpr uint8_t TAG_SESSION_ID     = 0x20;
static constexpr uint8_t TAG_DEBOUNCE_MS    = 0x21;

// Command
static constexpr uint8_t TAG_CMD_TYPE       = 0x30;
static constexpr uint8_t TAG_TAB_ID         = 0x31;
static constexpr uint8_t TAG_URL            = 0x32;
static constexpr uint8_t TAG_TARGET_INDEX   = 0x33;
static constexpr uint8_t TAG_CMD_TITLE      = 0x34;
static constexpr uint8_t TAG_LOADING        = 0x35;
static constexpr uint8_t TAG_OPT_TITLE      = 0x36;
static constexpr uint8_t TAG_OPT_PINNED     = 0x37;
static constexpr uint8_t TAG_OPT_POSITION   = 0x38;
static constexpr uint8_t TAG_OPT_INDEX      = 0x39;
static constexpr uint8_t TAG_OPT_ACTIVATE   = 0x3A;
static constexpr uint8_t TAG_BATCH_URL      = 0x3B;   // repeated, in order

// Response
static constexpr uint8_t TAG_SUCCESS        = 0x40;
static constexpr uint8_t TAG_ERROR          = 0x41;
static constexpr uint8_t TAG_DATA           = 0x42;

// Snapshot
static constexpr uint8_t TAG_REVISION       = 0x50;
static constexpr uint8_t TAG_REASON         = 0x51;
static constexpr uint8_t TAG_ACTIVE_ID      = 0x52;
static constexpr uint8_t TAG_PINNED_ID      = 0x53;
static constexpr uint8_t TAG_ORDER_ID       = 0x54;   // repeated, in order
static constexpr uint8_t TAG_TAB_BLOB       = 0x55;   // nested TLV for a tab

// Sub-tags within a tab blob
static constexpr uint8_t TAG_ITEM_ID        = 0x60;
static constexpr uint8_t TAG_ITEM_URL       = 0x61;
static constexpr uint8_t TAG_ITEM_TITLE     = 0x62;
static constexpr uint8_t TAG_ITEM_FAVICON   = 0x63;
static constexpr uint8_t TAG_ITEM_LOADING   = 0x64;
static constexpr uint8_t TAG_ITEM_PINNED    = 0x65;

// ─── Payload encode/decode ───────────────────────────────────────────────────

std::vector<uint8_t>        encode_hello(const HelloPayload& p);
std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_welcome(const WelcomePayload& p);
std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data);

// Returns std::nullopt for an unknown command type or a truncated payload.
std::vector<uint8_t>   encode_command(const Command& cmd);
std::optional<Command> decode_command(std::span<const uint8_t> data);

std::vector<uint8_t>           encode_response(const CommandResponse& resp);
std::optional<CommandResponse> decode_response(std::span<const uint8_t> data);

// Returns std::nullopt for an unknown reason, a truncated payload, or a tab
// blob without an id. Invariants are not checked here; the replica store
// validates snapshots before applying them.
std::vector<uint8_t>    encode_snapshot(const Snapshot& snap);
std::optional<Snapshot> decode_snapshot(std::span<const uint8_t> data);

}   // namespace tabsync::ipc
