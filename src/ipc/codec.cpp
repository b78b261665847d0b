#include "codec.hpp"

#include <cstring>

namespace tabsync::ipc
{

// ─── Little-endian helpers ───────────────────────────────────────────────────

static void write_u16_le(std::vector<uint8_t>& buf, uint16_t v)
{
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void write_u32_le(std::vector<uint8_t>& buf, uint32_t v)
{
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

static void write_u64_le(std::vector<uint8_t>& buf, uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static uint16_t read_u16_le(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8);
}

static uint32_t read_u32_le(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

static uint64_t read_u64_le(const uint8_t* p)
{
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    return v;
}

// ─── Header encode/decode ────────────────────────────────────────────────────

void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out)
{
    out.reserve(out.size() + HEADER_SIZE);
    out.push_back(MAGIC_0);
    out.push_back(MAGIC_1);
    write_u16_le(out, static_cast<uint16_t>(hdr.type));
    write_u32_le(out, hdr.payload_len);
    write_u64_le(out, hdr.seq);
    write_u64_le(out, hdr.request_id);
    write_u64_le(out, hdr.session_id);
    write_u64_le(out, 0);   // reserved
}

std::optional<MessageHeader> decode_header(std::span<const uint8_t> data)
{
    if (data.size() < HEADER_SIZE)
        return std::nullopt;
    if (data[0] != MAGIC_0 || data[1] != MAGIC_1)
        return std::nullopt;

    MessageHeader hdr;
    hdr.type        = static_cast<MessageType>(read_u16_le(&data[2]));
    hdr.payload_len = read_u32_le(&data[4]);
    hdr.seq         = read_u64_le(&data[8]);
    hdr.request_id  = read_u64_le(&data[16]);
    hdr.session_id  = read_u64_le(&data[24]);
    return hdr;
}

// ─── Full message encode/decode ──────────────────────────────────────────────

std::vector<uint8_t> encode_message(const Message& msg)
{
    std::vector<uint8_t> out;
    MessageHeader        hdr = msg.header;
    hdr.payload_len          = static_cast<uint32_t>(msg.payload.size());
    encode_header(hdr, out);
    out.insert(out.end(), msg.payload.begin(), msg.payload.end());
    return out;
}

std::optional<Message> decode_message(std::span<const uint8_t> data)
{
    auto hdr_opt = decode_header(data);
    if (!hdr_opt)
        return std::nullopt;

    auto& hdr = *hdr_opt;
    if (hdr.payload_len > MAX_PAYLOAD_SIZE)
        return std::nullopt;
    if (data.size() < HEADER_SIZE + hdr.payload_len)
        return std::nullopt;

    Message msg;
    msg.header = hdr;
    msg.payload.assign(data.begin() + HEADER_SIZE, data.begin() + HEADER_SIZE + hdr.payload_len);
    return msg;
}

// ─── PayloadEncoder ──────────────────────────────────────────────────────────

void PayloadEncoder::put_u8(uint8_t tag, uint8_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 1);
    buf_.push_back(val);
}

void PayloadEncoder::put_u16(uint8_t tag, uint16_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 2);
    write_u16_le(buf_, val);
}

void PayloadEncoder::put_u32(uint8_t tag, uint32_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 4);
    write_u32_le(buf_, val);
}

void PayloadEncoder::put_u64(uint8_t tag, uint64_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 8);
    write_u64_le(buf_, val);
}

void PayloadEncoder::put_string(uint8_t tag, const std::string& val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

void PayloadEncoder::put_blob(uint8_t tag, const std::vector<uint8_t>& blob)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(blob.size()));
    buf_.insert(buf_.end(), blob.begin(), blob.end());
}

// ─── PayloadDecoder ──────────────────────────────────────────────────────────

PayloadDecoder::PayloadDecoder(std::span<const uint8_t> data) : data_(data) {}

bool PayloadDecoder::next()
{
    if (pos_ == data_.size())
        return false;

    // Need at least 1 (tag) + 4 (len) bytes
    if (pos_ + 5 > data_.size())
    {
        malformed_ = true;
        return false;
    }

    tag_        = data_[pos_];
    len_        = read_u32_le(&data_[pos_ + 1]);
    val_offset_ = pos_ + 5;

    if (val_offset_ + len_ > data_.size())
    {
        malformed_ = true;
        return false;
    }

    pos_ = val_offset_ + len_;
    return true;
}

uint8_t PayloadDecoder::as_u8() const
{
    if (len_ < 1)
        return 0;
    return data_[val_offset_];
}

uint16_t PayloadDecoder::as_u16() const
{
    if (len_ < 2)
        return 0;
    return read_u16_le(&data_[val_offset_]);
}

uint32_t PayloadDecoder::as_u32() const
{
    if (len_ < 4)
        return 0;
    return read_u32_le(&data_[val_offset_]);
}

uint64_t PayloadDecoder::as_u64() const
{
    if (len_ < 8)
        return 0;
    return read_u64_le(&data_[val_offset_]);
}

std::string PayloadDecoder::as_string() const
{
    if (len_ == 0)
        return {};
    return std::string(reinterpret_cast<const char*>(&data_[val_offset_]), len_);
}

std::span<const uint8_t> PayloadDecoder::as_blob() const
{
    return data_.subspan(val_offset_, len_);
}

// ─── Handshake payload encode/decode ─────────────────────────────────────────

std::vector<uint8_t> encode_hello(const HelloPayload& p)
{
    PayloadEncoder enc;
    enc.put_u16(TAG_PROTOCOL_MAJOR, p.protocol_major);
    enc.put_u16(TAG_PROTOCOL_MINOR, p.protocol_minor);
    enc.put_string(TAG_CLIENT_NAME, p.client_name);
    return enc.take();
}

std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data)
{
    HelloPayload   p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_PROTOCOL_MAJOR: p.protocol_major = dec.as_u16(); break;
            case TAG_PROTOCOL_MINOR: p.protocol_minor = dec.as_u16(); break;
            case TAG_CLIENT_NAME:    p.client_name    = dec.as_string(); break;
            default: break;   // skip unknown tags (forward compat)
        }
    }
    if (dec.malformed())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_welcome(const WelcomePayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_SESSION_ID, p.session_id);
    enc.put_u32(TAG_DEBOUNCE_MS, p.push_debounce_ms);
    return enc.take();
}

std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data)
{
    WelcomePayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION_ID:  p.session_id       = dec.as_u64(); break;
            case TAG_DEBOUNCE_MS: p.push_debounce_ms = dec.as_u32(); break;
            default: break;
        }
    }
    if (dec.malformed() || p.session_id == INVALID_SESSION)
        return std::nullopt;
    return p;
}

// ─── Command / response encode/decode ────────────────────────────────────────

std::vector<uint8_t> encode_command(const Command& cmd)
{
    PayloadEncoder enc;
    enc.put_u8(TAG_CMD_TYPE, static_cast<uint8_t>(cmd.type));
    switch (cmd.type)
    {
        case CommandType::Create:
            enc.put_string(TAG_URL, cmd.url);
            if (!cmd.options.title.empty())
                enc.put_string(TAG_OPT_TITLE, cmd.options.title);
            enc.put_bool(TAG_OPT_PINNED, cmd.options.pinned);
            enc.put_u8(TAG_OPT_POSITION, static_cast<uint8_t>(cmd.options.position));
            enc.put_u32(TAG_OPT_INDEX, static_cast<uint32_t>(cmd.options.index));
            enc.put_bool(TAG_OPT_ACTIVATE, cmd.options.activate);
            break;
        case CommandType::Reorder:
            enc.put_string(TAG_TAB_ID, cmd.tab_id);
            enc.put_u32(TAG_TARGET_INDEX, cmd.target_index);
            break;
        case CommandType::UpdateTitle:
            enc.put_string(TAG_TAB_ID, cmd.tab_id);
            enc.put_string(TAG_CMD_TITLE, cmd.title);
            break;
        case CommandType::SetLoading:
            enc.put_string(TAG_TAB_ID, cmd.tab_id);
            enc.put_bool(TAG_LOADING, cmd.loading);
            break;
        case CommandType::Close:
        case CommandType::Switch:
        case CommandType::CloseOthers:
        case CommandType::Duplicate:
            enc.put_string(TAG_TAB_ID, cmd.tab_id);
            break;
        case CommandType::CreateBatch:
            for (const auto& url : cmd.urls)
                enc.put_string(TAG_BATCH_URL, url);
            break;
        case CommandType::CloseAll:
        case CommandType::GetStats:
            break;
    }
    return enc.take();
}

std::optional<Command> decode_command(std::span<const uint8_t> data)
{
    Command        cmd;
    bool           has_type = false;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_CMD_TYPE:
            {
                uint8_t raw = dec.as_u8();
                if (raw < static_cast<uint8_t>(CommandType::Create)
                    || raw > static_cast<uint8_t>(CommandType::GetStats))
                    return std::nullopt;
                cmd.type = static_cast<CommandType>(raw);
                has_type = true;
                break;
            }
            case TAG_TAB_ID:       cmd.tab_id           = dec.as_string(); break;
            case TAG_URL:          cmd.url              = dec.as_string(); break;
            case TAG_TARGET_INDEX: cmd.target_index     = dec.as_u32(); break;
            case TAG_CMD_TITLE:    cmd.title            = dec.as_string(); break;
            case TAG_LOADING:      cmd.loading          = dec.as_bool(); break;
            case TAG_OPT_TITLE:    cmd.options.title    = dec.as_string(); break;
            case TAG_OPT_PINNED:   cmd.options.pinned   = dec.as_bool(); break;
            case TAG_OPT_INDEX:    cmd.options.index    = dec.as_u32(); break;
            case TAG_OPT_ACTIVATE: cmd.options.activate = dec.as_bool(); break;
            case TAG_BATCH_URL:    cmd.urls.push_back(dec.as_string()); break;
            case TAG_OPT_POSITION:
            {
                uint8_t raw = dec.as_u8();
                if (raw > static_cast<uint8_t>(CreateOptions::Position::Background))
                    return std::nullopt;
                cmd.options.position = static_cast<CreateOptions::Position>(raw);
                break;
            }
            default: break;
        }
    }
    if (dec.malformed() || !has_type)
        return std::nullopt;
    return cmd;
}

std::vector<uint8_t> encode_response(const CommandResponse& resp)
{
    PayloadEncoder enc;
    enc.put_bool(TAG_SUCCESS, resp.success);
    if (!resp.error.empty())
        enc.put_string(TAG_ERROR, resp.error);
    if (!resp.data.empty())
        enc.put_string(TAG_DATA, resp.data);
    return enc.take();
}

std::optional<CommandResponse> decode_response(std::span<const uint8_t> data)
{
    CommandResponse resp;
    PayloadDecoder  dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SUCCESS: resp.success = dec.as_bool(); break;
            case TAG_ERROR:   resp.error   = dec.as_string(); break;
            case TAG_DATA:    resp.data    = dec.as_string(); break;
            default: break;
        }
    }
    if (dec.malformed())
        return std::nullopt;
    return resp;
}

// ─── Snapshot encode/decode ──────────────────────────────────────────────────

static std::vector<uint8_t> encode_tab_blob(const TabItem& item)
{
    PayloadEncoder enc;
    enc.put_string(TAG_ITEM_ID, item.id);
    enc.put_string(TAG_ITEM_URL, item.url);
    enc.put_string(TAG_ITEM_TITLE, item.title);
    if (!item.favicon_ref.empty())
        enc.put_string(TAG_ITEM_FAVICON, item.favicon_ref);
    enc.put_bool(TAG_ITEM_LOADING, item.is_loading);
    enc.put_bool(TAG_ITEM_PINNED, item.is_pinned);
    return enc.take();
}

static std::optional<TabItem> decode_tab_blob(std::span<const uint8_t> data)
{
    TabItem        item;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_ITEM_ID:      item.id          = dec.as_string(); break;
            case TAG_ITEM_URL:     item.url         = dec.as_string(); break;
            case TAG_ITEM_TITLE:   item.title       = dec.as_string(); break;
            case TAG_ITEM_FAVICON: item.favicon_ref = dec.as_string(); break;
            case TAG_ITEM_LOADING: item.is_loading  = dec.as_bool(); break;
            case TAG_ITEM_PINNED:  item.is_pinned   = dec.as_bool(); break;
            default: break;
        }
    }
    if (dec.malformed() || item.id.empty())
        return std::nullopt;
    return item;
}

std::vector<uint8_t> encode_snapshot(const Snapshot& snap)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REVISION, snap.revision);
    enc.put_u8(TAG_REASON, static_cast<uint8_t>(snap.reason));
    if (snap.state.active_id)
        enc.put_string(TAG_ACTIVE_ID, *snap.state.active_id);
    if (snap.state.pinned_id)
        enc.put_string(TAG_PINNED_ID, *snap.state.pinned_id);
    for (const auto& id : snap.state.order)
        enc.put_string(TAG_ORDER_ID, id);
    // Tabs are written in display order so the payload is deterministic.
    for (const auto& item : snap.state.ordered_items())
        enc.put_blob(TAG_TAB_BLOB, encode_tab_blob(item));
    return enc.take();
}

std::optional<Snapshot> decode_snapshot(std::span<const uint8_t> data)
{
    Snapshot       snap;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_REVISION: snap.revision = dec.as_u64(); break;
            case TAG_REASON:
            {
                uint8_t raw = dec.as_u8();
                if (raw > static_cast<uint8_t>(SnapshotReason::Immediate))
                    return std::nullopt;
                snap.reason = static_cast<SnapshotReason>(raw);
                break;
            }
            case TAG_ACTIVE_ID: snap.state.active_id = dec.as_string(); break;
            case TAG_PINNED_ID: snap.state.pinned_id = dec.as_string(); break;
            case TAG_ORDER_ID:  snap.state.order.push_back(dec.as_string()); break;
            case TAG_TAB_BLOB:
            {
                auto item = decode_tab_blob(dec.as_blob());
                if (!item)
                    return std::nullopt;
                TabId id = item->id;
                snap.state.tabs.insert_or_assign(std::move(id), std::move(*item));
                break;
            }
            default: break;
        }
    }
    if (dec.malformed())
        return std::nullopt;
    return snap;
}

}   // namespace tabsync::ipc
