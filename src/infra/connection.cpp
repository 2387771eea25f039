#include "hb/connection.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/uio.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "hb/config.hpp"

namespace hb
{
namespace
{
Failure make_failure(FailureKind kind, std::string msg)
{
    return Failure{kind, std::move(msg)};
}

Failure errno_failure(FailureKind kind, const char *what, int err)
{
    return make_failure(kind, std::string(what) + ": " + std::strerror(err));
}

Failure timeout_failure(const char *phase)
{
    return make_failure(FailureKind::Timeout, std::string(phase) + " timed out");
}

// Drains the thread's OpenSSL error queue into one message
std::string ssl_error_string(const char *what)
{
    std::string msg(what);
    char buf[256];
    bool first = true;
    while (unsigned long e = ERR_get_error())
    {
        ERR_error_string_n(e, buf, sizeof(buf));
        msg += first ? ": " : "; ";
        msg += buf;
        first = false;
    }
    return msg;
}

bool is_ip_literal(const std::string &host)
{
    unsigned char buf[sizeof(in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

enum class WaitResult { Ready, TimedOut, Error };

// poll() on one descriptor, retried on EINTR, bounded by the deadline
WaitResult wait_fd(int fd, short events, const Deadline &deadline)
{
    for (;;)
    {
        int timeout_ms = -1;
        if (deadline)
        {
            const auto left = *deadline - Clock::now();
            if (left <= Clock::duration::zero()) return WaitResult::TimedOut;
            // round up so we never wake just before the deadline
            timeout_ms = static_cast<int>(
                std::chrono::ceil<std::chrono::milliseconds>(left).count());
        }
        pollfd p{fd, events, 0};
        const int rc = ::poll(&p, 1, timeout_ms);
        if (rc > 0) return WaitResult::Ready;
        if (rc == 0) return WaitResult::TimedOut;
        if (errno != EINTR) return WaitResult::Error;
    }
}
} // namespace

// ---------------------- TlsContext ----------------------

std::shared_ptr<TlsContext> TlsContext::create()
{
    SSL_CTX *ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx) throw ConfigError(ssl_error_string("cannot create TLS context"));

    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    SSL_CTX_set_mode(ctx, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // servers often close without close_notify once the body is complete
    SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    static const unsigned char kAlpn[] = "\x08http/1.1";
    if (SSL_CTX_set_alpn_protos(ctx, kAlpn, sizeof(kAlpn) - 1) != 0)
    {
        SSL_CTX_free(ctx);
        throw ConfigError(ssl_error_string("cannot set ALPN"));
    }
    return std::shared_ptr<TlsContext>(new TlsContext(ctx));
}

TlsContext::~TlsContext()
{
    SSL_CTX_free(ctx_);
}

// ---------------------- Connection ----------------------

Connection::~Connection()
{
    close();
}

void Connection::close()
{
    if (ssl_)
    {
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    fd_.reset();
}

std::optional<Failure> Connection::connect(
    const std::vector<ResolvedAddress> &addrs, bool tcp_nodelay,
    const Deadline &deadline)
{
    close();
    if (addrs.empty()) return make_failure(FailureKind::Connect, "no address to connect to");

    Failure last = make_failure(FailureKind::Connect, "connect failed");
    for (const auto &a: addrs)
    {
        Fd fd(::socket(a.family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP));
        if (!fd)
        {
            // EMFILE/ENFILE under high concurrency land here
            last = errno_failure(FailureKind::Connect, "socket", errno);
            continue;
        }
        if (tcp_nodelay)
        {
            int one = 1;
            if (::setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0)
            {
                last = errno_failure(FailureKind::Connect, "setsockopt(TCP_NODELAY)", errno);
                continue;
            }
        }

        if (::connect(fd.get(), reinterpret_cast<const sockaddr *>(&a.addr), a.len) != 0)
        {
            if (errno != EINPROGRESS)
            {
                last = errno_failure(FailureKind::Connect, "connect", errno);
                continue;
            }
            const WaitResult w = wait_fd(fd.get(), POLLOUT, deadline);
            if (w == WaitResult::TimedOut) return timeout_failure("connect");
            if (w == WaitResult::Error)
            {
                last = errno_failure(FailureKind::Connect, "poll", errno);
                continue;
            }
            int err = 0;
            socklen_t len = sizeof(err);
            if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &err, &len) != 0) err = errno;
            if (err != 0)
            {
                last = errno_failure(FailureKind::Connect, "connect", err);
                continue;
            }
        }
        fd_ = std::move(fd);
        return std::nullopt;
    }
    return last;
}

std::optional<Failure> Connection::handshake(const TlsContext &ctx,
                                             const std::string &server_name,
                                             const Deadline &deadline)
{
    ERR_clear_error();
    ssl_ = SSL_new(ctx.get());
    if (!ssl_) return make_failure(FailureKind::Tls, ssl_error_string("SSL_new"));
    if (SSL_set_fd(ssl_, fd_.get()) != 1)
        return make_failure(FailureKind::Tls, ssl_error_string("SSL_set_fd"));
    if (!is_ip_literal(server_name))
        SSL_set_tlsext_host_name(ssl_, server_name.c_str());

    for (;;)
    {
        errno = 0;
        const int rc = SSL_connect(ssl_);
        if (rc == 1) return std::nullopt;
        const int err = SSL_get_error(ssl_, rc);
        short events = 0;
        if (err == SSL_ERROR_WANT_READ) events = POLLIN;
        else if (err == SSL_ERROR_WANT_WRITE) events = POLLOUT;
        else if (err == SSL_ERROR_SYSCALL && errno != 0)
            return errno_failure(FailureKind::Tls, "TLS handshake", errno);
        else return make_failure(FailureKind::Tls, ssl_error_string("TLS handshake"));

        const WaitResult w = wait_fd(fd_.get(), events, deadline);
        if (w == WaitResult::TimedOut) return timeout_failure("TLS handshake");
        if (w == WaitResult::Error) return errno_failure(FailureKind::Tls, "poll", errno);
    }
}

std::optional<Failure> Connection::write_request(std::string_view head,
                                                 std::string_view body,
                                                 const Deadline &deadline)
{
    if (ssl_)
    {
        if (body.empty()) return ssl_write_all(head, deadline);
        scratch_.assign(head);
        scratch_.append(body);
        auto f = ssl_write_all(scratch_, deadline);
        scratch_.clear();
        return f;
    }

    iovec iov[2] = {
        {const_cast<char *>(head.data()), head.size()},
        {const_cast<char *>(body.data()), body.size()},
    };
    size_t first = 0;
    while (first < 2)
    {
        if (iov[first].iov_len == 0)
        {
            ++first;
            continue;
        }
        msghdr msg{};
        msg.msg_iov = iov + first;
        msg.msg_iovlen = 2 - first;
        const ssize_t n = ::sendmsg(fd_.get(), &msg, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                return errno_failure(FailureKind::Write, "write", errno);
            const WaitResult w = wait_fd(fd_.get(), POLLOUT, deadline);
            if (w == WaitResult::TimedOut) return timeout_failure("write");
            if (w == WaitResult::Error) return errno_failure(FailureKind::Write, "poll", errno);
            continue;
        }
        auto sent = static_cast<size_t>(n);
        while (first < 2 && sent >= iov[first].iov_len)
        {
            sent -= iov[first].iov_len;
            iov[first].iov_len = 0;
            ++first;
        }
        if (first < 2)
        {
            iov[first].iov_base = static_cast<char *>(iov[first].iov_base) + sent;
            iov[first].iov_len -= sent;
        }
    }
    return std::nullopt;
}

std::optional<Failure> Connection::ssl_write_all(std::string_view data,
                                                 const Deadline &deadline)
{
    while (!data.empty())
    {
        ERR_clear_error();
        errno = 0;
        const int n = SSL_write(ssl_, data.data(), static_cast<int>(data.size()));
        if (n > 0)
        {
            data.remove_prefix(static_cast<size_t>(n));
            continue;
        }
        const int err = SSL_get_error(ssl_, n);
        short events = POLLOUT;
        if (err == SSL_ERROR_WANT_READ) events = POLLIN;
        else if (err != SSL_ERROR_WANT_WRITE)
        {
            if (err == SSL_ERROR_SYSCALL && errno != 0)
                return errno_failure(FailureKind::Write, "write", errno);
            return make_failure(FailureKind::Write, ssl_error_string("write"));
        }

        const WaitResult w = wait_fd(fd_.get(), events, deadline);
        if (w == WaitResult::TimedOut) return timeout_failure("write");
        if (w == WaitResult::Error) return errno_failure(FailureKind::Write, "poll", errno);
    }
    return std::nullopt;
}

std::variant<size_t, Failure> Connection::read_some(char *buf, size_t cap,
                                                    const Deadline &deadline)
{
    for (;;)
    {
        short events = POLLIN;
        if (ssl_)
        {
            ERR_clear_error();
            errno = 0;
            const int n = SSL_read(ssl_, buf, static_cast<int>(cap));
            if (n > 0) return static_cast<size_t>(n);
            const int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_ZERO_RETURN) return size_t{0};
            if (err == SSL_ERROR_WANT_WRITE) events = POLLOUT;
            else if (err != SSL_ERROR_WANT_READ)
            {
                if (err == SSL_ERROR_SYSCALL && errno == 0) return size_t{0};
                if (err == SSL_ERROR_SYSCALL)
                    return errno_failure(FailureKind::Read, "read", errno);
                return make_failure(FailureKind::Read, ssl_error_string("read"));
            }
        }
        else
        {
            const ssize_t n = ::recv(fd_.get(), buf, cap, 0);
            if (n >= 0) return static_cast<size_t>(n);
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                return errno_failure(FailureKind::Read, "read", errno);
        }

        const WaitResult w = wait_fd(fd_.get(), events, deadline);
        if (w == WaitResult::TimedOut) return timeout_failure("read");
        if (w == WaitResult::Error) return errno_failure(FailureKind::Read, "poll", errno);
    }
}
} // namespace hb
