#include "redis-cache-store.h"

#include "tts-log.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

static constexpr size_t k_redis_read_chunk = 64 * 1024;

static void close_fd(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

static bool set_blocking(int fd, bool blocking) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    const int want = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, want) == 0;
}

static void set_io_timeouts(int fd, int32_t timeout_ms) {
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    const int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

static bool connect_with_timeout(int fd, const sockaddr * addr, socklen_t addr_len, int32_t timeout_ms, std::string & err) {
    if (!set_blocking(fd, false)) {
        err = "fcntl failed";
        return false;
    }
    int rc = ::connect(fd, addr, addr_len);
    if (rc != 0 && errno != EINPROGRESS) {
        err = std::string("connect failed: ") + std::strerror(errno);
        return false;
    }
    if (rc != 0) {
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        rc = ::poll(&pfd, 1, timeout_ms);
        if (rc == 0) {
            err = "connect timed out";
            return false;
        }
        if (rc < 0) {
            err = std::string("poll failed: ") + std::strerror(errno);
            return false;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
            err = std::string("connect failed: ") + std::strerror(so_error != 0 ? so_error : errno);
            return false;
        }
    }
    if (!set_blocking(fd, true)) {
        err = "fcntl failed";
        return false;
    }
    return true;
}

static bool send_all(int fd, const std::string & data, std::string & err) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            err = (errno == EAGAIN || errno == EWOULDBLOCK)
                    ? std::string("write timed out")
                    : std::string("send failed: ") + std::strerror(errno);
            return false;
        }
        off += (size_t) n;
    }
    return true;
}

redis_cache_store::redis_cache_store(const redis_params & params)
    : params_(params) {
}

redis_cache_store::~redis_cache_store() {
    std::lock_guard<std::mutex> lock(pool_mtx_);
    for (int fd : idle_) {
        close_fd(fd);
    }
    idle_.clear();
}

bool redis_cache_store::get(const std::string & key, std::vector<uint8_t> & value, bool & found, std::string & err) {
    found = false;
    resp_reply reply;
    if (!execute({"GET", key}, reply, err)) {
        return false;
    }
    if (reply.type == RESP_TYPE_NIL) {
        return true;
    }
    if (reply.type != RESP_TYPE_BULK) {
        err = reply.type == RESP_TYPE_ERROR ? "redis GET: " + reply.str : std::string("redis GET: unexpected reply type");
        return false;
    }
    value.assign(reply.str.begin(), reply.str.end());
    found = true;
    return true;
}

bool redis_cache_store::set(const std::string & key, const std::vector<uint8_t> & value, int32_t ttl_sec, std::string & err) {
    if (ttl_sec <= 0) {
        err = "ttl must be positive";
        return false;
    }
    resp_reply reply;
    const std::string payload(value.begin(), value.end());
    if (!execute({"SETEX", key, std::to_string(ttl_sec), payload}, reply, err)) {
        return false;
    }
    if (reply.type != RESP_TYPE_SIMPLE || reply.str != "OK") {
        err = reply.type == RESP_TYPE_ERROR ? "redis SETEX: " + reply.str : std::string("redis SETEX: unexpected reply");
        return false;
    }
    return true;
}

bool redis_cache_store::ping(std::string & err) {
    resp_reply reply;
    if (!execute({"PING"}, reply, err)) {
        return false;
    }
    if (reply.type != RESP_TYPE_SIMPLE) {
        err = "redis PING: " + (reply.type == RESP_TYPE_ERROR ? reply.str : std::string("unexpected reply"));
        return false;
    }
    return true;
}

bool redis_cache_store::execute(const std::vector<std::string> & args, resp_reply & reply, std::string & err) {
    int fd = -1;
    if (!checkout(fd, err)) {
        return false;
    }
    if (!command(fd, args, reply, err)) {
        close_fd(fd);
        return false;
    }
    checkin(fd);
    return true;
}

bool redis_cache_store::checkout(int & fd, std::string & err) {
    {
        std::lock_guard<std::mutex> lock(pool_mtx_);
        if (!idle_.empty()) {
            fd = idle_.back();
            idle_.pop_back();
            return true;
        }
    }
    return connect_new(fd, err);
}

void redis_cache_store::checkin(int fd) {
    std::lock_guard<std::mutex> lock(pool_mtx_);
    if ((int32_t) idle_.size() >= params_.max_idle_connections) {
        close_fd(fd);
        return;
    }
    idle_.push_back(fd);
}

bool redis_cache_store::connect_new(int & fd, std::string & err) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo * res = nullptr;
    const std::string port = std::to_string(params_.port);
    const int gai = ::getaddrinfo(params_.host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0) {
        err = "redis resolve " + params_.host + ": " + gai_strerror(gai);
        return false;
    }

    std::string last_err = "no address";
    int sock = -1;
    for (addrinfo * ai = res; ai != nullptr; ai = ai->ai_next) {
        sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_err = std::string("socket failed: ") + std::strerror(errno);
            continue;
        }
        if (connect_with_timeout(sock, ai->ai_addr, ai->ai_addrlen, params_.timeout_ms, last_err)) {
            break;
        }
        close_fd(sock);
        sock = -1;
    }
    ::freeaddrinfo(res);

    if (sock < 0) {
        err = "redis " + params_.host + ":" + port + ": " + last_err;
        return false;
    }
    set_io_timeouts(sock, params_.timeout_ms);

    resp_reply reply;
    if (!params_.password.empty()) {
        if (!command(sock, {"AUTH", params_.password}, reply, err)) {
            close_fd(sock);
            return false;
        }
        if (reply.type == RESP_TYPE_ERROR) {
            err = "redis AUTH: " + reply.str;
            close_fd(sock);
            return false;
        }
    }
    if (params_.db != 0) {
        if (!command(sock, {"SELECT", std::to_string(params_.db)}, reply, err)) {
            close_fd(sock);
            return false;
        }
        if (reply.type == RESP_TYPE_ERROR) {
            err = "redis SELECT: " + reply.str;
            close_fd(sock);
            return false;
        }
    }

    TTS_LOG_DEBUG("redis: connected to %s:%d\n", params_.host.c_str(), params_.port);
    fd = sock;
    return true;
}

bool redis_cache_store::command(int fd, const std::vector<std::string> & args, resp_reply & reply, std::string & err) {
    if (!send_all(fd, resp_encode_command(args), err)) {
        return false;
    }

    std::string buf;
    char chunk[k_redis_read_chunk];
    for (;;) {
        if (!buf.empty()) {
            size_t consumed = 0;
            const resp_parse_status st = resp_parse(buf.data(), buf.size(), consumed, reply, err);
            if (st == RESP_PARSE_OK) {
                return true;
            }
            if (st == RESP_PARSE_ERROR) {
                return false;
            }
        }
        const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n == 0) {
            err = "redis closed the connection";
            return false;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            err = (errno == EAGAIN || errno == EWOULDBLOCK)
                    ? std::string("redis read timed out")
                    : std::string("recv failed: ") + std::strerror(errno);
            return false;
        }
        buf.append(chunk, (size_t) n);
    }
}
