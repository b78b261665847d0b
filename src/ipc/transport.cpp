#include "transport.hpp"

#include <tabsync/logger.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/uio.h>
#include <sys/un.h>
#include <unistd.h>
#include <vector>

#include "codec.hpp"

namespace tabsync::ipc
{

namespace
{

constexpr int LISTEN_BACKLOG = 8;

bool make_address(const std::string& path, sockaddr_un& addr)
{
    addr            = {};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
        return false;
    std::memcpy(addr.sun_path, path.data(), path.size());
    return true;
}

int open_stream_socket(bool nonblocking)
{
    int type = SOCK_STREAM | SOCK_CLOEXEC;
    if (nonblocking)
        type |= SOCK_NONBLOCK;
    return ::socket(AF_UNIX, type, 0);
}

// Connect a fresh socket to `addr`; -1 when nobody accepts there.
int connect_socket(const sockaddr_un& addr)
{
    int fd = open_stream_socket(false);
    if (fd < 0)
        return -1;
    int rc;
    do
    {
        rc = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    } while (rc < 0 && errno == EINTR);
    if (rc < 0)
    {
        ::close(fd);
        return -1;
    }
    return fd;
}

}   // namespace

std::string_view read_status_to_string(ReadStatus status)
{
    switch (status)
    {
        case ReadStatus::Frame:
            return "frame";
        case ReadStatus::PeerClosed:
            return "peer-closed";
        case ReadStatus::Rejected:
            return "rejected";
    }
    return "unknown";
}

// ─── Connection ──────────────────────────────────────────────────────────────

Connection::Connection(int fd) : fd_(fd) {}

Connection::~Connection()
{
    close();
}

bool Connection::read_fully(uint8_t* buf, size_t len)
{
    size_t got = 0;
    while (got < len)
    {
        ssize_t n = ::recv(fd_, buf + got, len - got, 0);
        if (n > 0)
        {
            got += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        return false;
    }
    return true;
}

// Header and payload leave in one sendmsg() where the kernel allows it, so
// the payload is never copied into a staging buffer.
bool Connection::write_frame(const uint8_t* header, size_t header_len, std::span<const uint8_t> payload)
{
    iovec parts[2];
    parts[0].iov_base = const_cast<uint8_t*>(header);
    parts[0].iov_len  = header_len;
    parts[1].iov_base = const_cast<uint8_t*>(payload.data());
    parts[1].iov_len  = payload.size();

    iovec* iov       = parts;
    size_t iov_count = payload.empty() ? 1 : 2;
    while (iov_count > 0)
    {
        msghdr mh{};
        mh.msg_iov    = iov;
        mh.msg_iovlen = iov_count;
        ssize_t n     = ::sendmsg(fd_, &mh, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }

        auto sent = static_cast<size_t>(n);
        while (iov_count > 0 && sent >= iov->iov_len)
        {
            sent -= iov->iov_len;
            ++iov;
            --iov_count;
        }
        if (iov_count > 0)
        {
            iov->iov_base = static_cast<uint8_t*>(iov->iov_base) + sent;
            iov->iov_len -= sent;
        }
    }
    return true;
}

bool Connection::send(MessageType type, SessionId session, RequestId request, std::span<const uint8_t> payload)
{
    if (fd_ < 0)
        return false;
    if (payload.size() > MAX_PAYLOAD_SIZE)
    {
        TABSYNC_LOG_ERROR("ipc", "refusing to send {} byte payload", payload.size());
        return false;
    }

    MessageHeader hdr;
    hdr.type        = type;
    hdr.payload_len = static_cast<uint32_t>(payload.size());
    hdr.seq         = next_seq_;
    hdr.request_id  = request;
    hdr.session_id  = session;

    std::vector<uint8_t> head;
    encode_header(hdr, head);
    if (!write_frame(head.data(), head.size(), payload))
        return false;
    ++next_seq_;
    return true;
}

ReadStatus Connection::read(Message& out)
{
    if (fd_ < 0)
        return ReadStatus::PeerClosed;

    uint8_t head[HEADER_SIZE];
    if (!read_fully(head, HEADER_SIZE))
        return ReadStatus::PeerClosed;

    auto hdr = decode_header(std::span<const uint8_t>(head, HEADER_SIZE));
    if (!hdr)
    {
        TABSYNC_LOG_WARN("ipc", "frame with bad magic on fd {}", fd_);
        close();
        return ReadStatus::Rejected;
    }
    auto raw_type = static_cast<uint16_t>(hdr->type);
    if (!is_known_message_type(raw_type))
    {
        TABSYNC_LOG_WARN("ipc", "frame with unknown type {} on fd {}", raw_type, fd_);
        close();
        return ReadStatus::Rejected;
    }
    if (hdr->payload_len > MAX_PAYLOAD_SIZE)
    {
        TABSYNC_LOG_WARN("ipc", "frame announces {} byte payload, limit is {}", hdr->payload_len, MAX_PAYLOAD_SIZE);
        close();
        return ReadStatus::Rejected;
    }

    out.header = *hdr;
    out.payload.resize(hdr->payload_len);
    if (hdr->payload_len > 0 && !read_fully(out.payload.data(), hdr->payload_len))
        return ReadStatus::PeerClosed;

    if (hdr->seq != 0 && hdr->seq <= last_peer_seq_)
        TABSYNC_LOG_DEBUG("ipc", "peer sequence went back from {} to {}", last_peer_seq_, hdr->seq);
    last_peer_seq_ = hdr->seq;
    ++frames_received_;
    return ReadStatus::Frame;
}

bool Connection::wait_readable(int timeout_ms) const
{
    if (fd_ < 0)
        return false;

    pollfd pfd{};
    pfd.fd     = fd_;
    pfd.events = POLLIN;
    int rc;
    do
    {
        rc = ::poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);

    return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void Connection::close()
{
    if (fd_ < 0)
        return;
    ::close(fd_);
    fd_ = -1;
}

std::unique_ptr<Connection> connect_to(const std::string& path)
{
    sockaddr_un addr;
    if (!make_address(path, addr))
        return nullptr;
    int fd = connect_socket(addr);
    if (fd < 0)
        return nullptr;
    return std::make_unique<Connection>(fd);
}

// ─── Listener ────────────────────────────────────────────────────────────────

Listener::~Listener()
{
    close();
}

bool Listener::listen(const std::string& path)
{
    close();

    sockaddr_un addr;
    if (!make_address(path, addr))
    {
        TABSYNC_LOG_ERROR("ipc", "socket path unusable: '{}'", path);
        return false;
    }

    struct stat st{};
    if (::lstat(path.c_str(), &st) == 0)
    {
        if (!S_ISSOCK(st.st_mode))
        {
            TABSYNC_LOG_ERROR("ipc", "{} exists and is not a socket", path);
            return false;
        }
        int live_fd = connect_socket(addr);
        if (live_fd >= 0)
        {
            ::close(live_fd);
            TABSYNC_LOG_ERROR("ipc", "another authority is already listening on {}", path);
            return false;
        }
        ::unlink(path.c_str());
    }

    // Non-blocking once and for all: accept_pending() never waits.
    int fd = open_stream_socket(true);
    if (fd < 0)
        return false;

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        TABSYNC_LOG_ERROR("ipc", "bind({}) failed, errno {}", path, errno);
        ::close(fd);
        return false;
    }
    ::chmod(path.c_str(), S_IRWXU);

    if (::listen(fd, LISTEN_BACKLOG) < 0)
    {
        ::close(fd);
        ::unlink(path.c_str());
        return false;
    }

    fd_   = fd;
    path_ = path;
    return true;
}

std::unique_ptr<Connection> Listener::accept_pending()
{
    if (fd_ < 0)
        return nullptr;

    // Accepted sockets stay blocking; Connection::read() waits for whole frames.
    int peer;
    do
    {
        peer = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    } while (peer < 0 && errno == EINTR);

    if (peer < 0)
    {
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            TABSYNC_LOG_WARN("ipc", "accept failed, errno {}", errno);
        return nullptr;
    }
    return std::make_unique<Connection>(peer);
}

void Listener::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
    if (!path_.empty())
    {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

std::string default_socket_path()
{
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    std::string dir     = (runtime && *runtime) ? runtime : "/tmp";
    return dir + "/tabsync-" + std::to_string(::getuid()) + ".sock";
}

}   // namespace tabsync::ipc
