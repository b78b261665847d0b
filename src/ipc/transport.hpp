#pragma once

#include "message.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace tabsync::ipc
{

// Why Connection::read() stopped.
enum class ReadStatus
{
    Frame,        // `out` holds one complete message
    PeerClosed,   // orderly EOF or a socket error
    Rejected,     // bad magic, unknown type or oversized payload; link is closed
};

std::string_view read_status_to_string(ReadStatus status);

// ─── Connection ──────────────────────────────────────────────────────────────
// One end of an authority session. Outbound frames carry a per-connection
// sequence number starting at 1. Inbound frames are validated before their
// payload is read; a frame that fails validation closes the connection since
// the stream can no longer be resynchronized.
// Not thread-safe.

class Connection
{
   public:
    explicit Connection(int fd);
    ~Connection();

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool is_open() const { return fd_ >= 0; }
    int  fd() const { return fd_; }

    // Frame and write one message. Returns false if the peer is gone
    // (never raises SIGPIPE).
    bool send(MessageType type, SessionId session, RequestId request, std::span<const uint8_t> payload);

    // Block until one full frame has arrived.
    ReadStatus read(Message& out);

    // Wait up to `timeout_ms` for input (0 = just check). Hang-up counts as
    // readable so the following read() reports it.
    bool wait_readable(int timeout_ms) const;

    void close();

    uint64_t frames_sent() const { return next_seq_ - 1; }
    uint64_t frames_received() const { return frames_received_; }
    uint64_t last_peer_seq() const { return last_peer_seq_; }

   private:
    bool read_fully(uint8_t* buf, size_t len);
    bool write_frame(const uint8_t* header, size_t header_len, std::span<const uint8_t> payload);

    int      fd_              = -1;
    uint64_t next_seq_        = 1;
    uint64_t frames_received_ = 0;
    uint64_t last_peer_seq_   = 0;
};

// Connect to an authority listening at `path`. nullptr if nobody answers.
std::unique_ptr<Connection> connect_to(const std::string& path);

// ─── Listener ────────────────────────────────────────────────────────────────
// The authority's listening socket. Only one authority may own a path: a
// leftover socket file is replaced only when nothing accepts on it, and a
// path that exists but is not a socket is never removed.

class Listener
{
   public:
    Listener() = default;
    ~Listener();

    Listener(const Listener&)            = delete;
    Listener& operator=(const Listener&) = delete;

    bool listen(const std::string& path);

    // Non-blocking; nullptr when no peer is waiting.
    std::unique_ptr<Connection> accept_pending();

    void close();

    bool               is_listening() const { return fd_ >= 0; }
    int                fd() const { return fd_; }
    const std::string& path() const { return path_; }

   private:
    int         fd_ = -1;
    std::string path_;
};

// $XDG_RUNTIME_DIR/tabsync-<uid>.sock, or /tmp/tabsync-<uid>.sock when
// XDG_RUNTIME_DIR is unset.
std::string default_socket_path();

}   // namespace tabsync::ipc
