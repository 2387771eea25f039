#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <unistd.h>

#include "hb/model.hpp"
#include "hb/resolver.hpp"

// OpenSSL handles, kept opaque here
struct ssl_st;
struct ssl_ctx_st;

namespace hb
{
using Deadline = std::optional<Clock::time_point>;

class Fd
{
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }
    Fd(const Fd &) = delete;
    Fd &operator=(const Fd &) = delete;
    Fd(Fd &&o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    Fd &operator=(Fd &&o) noexcept
    {
        if (this != &o)
        {
            reset();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }
    int get() const { return fd_; }
    void reset(int fd = -1)
    {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }
    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_{-1};
};

// Client SSL_CTX shared by all workers. Peer certificates are not verified.
class TlsContext
{
public:
    // Throws ConfigError when OpenSSL cannot create the context.
    static std::shared_ptr<TlsContext> create();
    ~TlsContext();
    TlsContext(const TlsContext &) = delete;
    TlsContext &operator=(const TlsContext &) = delete;

    ssl_ctx_st *get() const { return ctx_; }

private:
    explicit TlsContext(ssl_ctx_st *ctx) : ctx_(ctx) {}
    ssl_ctx_st *ctx_;
};

// One client connection (plain TCP or TLS over TCP) on a non-blocking socket.
// Every blocking step waits in poll() no longer than the deadline allows.
class Connection
{
public:
    Connection() = default;
    ~Connection();
    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Tries the addresses in order; the first that connects wins.
    std::optional<Failure> connect(const std::vector<ResolvedAddress> &addrs,
                                   bool tcp_nodelay, const Deadline &deadline);

    std::optional<Failure> handshake(const TlsContext &ctx,
                                     const std::string &server_name,
                                     const Deadline &deadline);

    // Sends head followed by body. Plain sockets gather both into one send;
    // TLS goes through a scratch buffer so they share one record.
    std::optional<Failure> write_request(std::string_view head,
                                         std::string_view body,
                                         const Deadline &deadline);

    // Bytes read into buf; 0 means the peer closed the stream.
    std::variant<size_t, Failure> read_some(char *buf, size_t cap,
                                            const Deadline &deadline);

    bool is_open() const { return static_cast<bool>(fd_); }
    void close();

private:
    std::optional<Failure> ssl_write_all(std::string_view data,
                                         const Deadline &deadline);

    Fd fd_;
    ssl_st *ssl_{nullptr};
    std::string scratch_;
};
} // namespace hb
