#include <peerlink/common.hpp>
#include <peerlink/logger.hpp>
#include <cerrno>
#include <cstring>
#include <chrono>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace peerlink {
    namespace common {

        int setSocketNonBlocking(sock_t fd) {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags == -1) {
                LOG_NET_WARN("fcntl F_GETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
                LOG_NET_WARN("fcntl F_SETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            return 0;
        }

        void closeSocket(sock_t fd) {
            if (fd >= 0) {
                close(fd);
                LOG_NET_DEBUG("socket closed: {}", fd);
            }
        }

        int enableSocketKeepAliveAndNoDelay(sock_t fd) {
            int on = 1;
            if (setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on)) != 0) {
                LOG_NET_WARN("setsockopt(SO_KEEPALIVE) failed fd={} err={}", fd, strerror(errno));
            }
            // keepalive tuning (best-effort)
#ifdef TCP_KEEPIDLE
            int idle = 30;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
#endif
#ifdef TCP_KEEPINTVL
            int interval = 5;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
#endif
#ifdef TCP_KEEPCNT
            int cnt = 3;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif

            if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)) != 0) {
                LOG_NET_WARN("setsockopt(TCP_NODELAY) failed fd={} err={}", fd, strerror(errno));
            }
            return 0;
        }

        sock_t connectTcp(const std::string &host, int port, int timeoutMs) {
            addrinfo hints{};
            addrinfo *res = nullptr;
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            int gai = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
            if (gai != 0) {
                LOG_NET_WARN("getaddrinfo failed for {}:{}: {}", host, port, gai_strerror(gai));
                return INVALID_SOCK;
            }

            sock_t fd = INVALID_SOCK;
            for (addrinfo *rp = res; rp; rp = rp->ai_next) {
                fd = socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
                if (fd == INVALID_SOCK) continue;

                setSocketNonBlocking(fd);
                enableSocketKeepAliveAndNoDelay(fd);

                int r = connect(fd, rp->ai_addr, rp->ai_addrlen);
                if (r == 0) break;
                if (errno == EINPROGRESS) {
                    pollfd pfd{fd, POLLOUT, 0};
                    int pr = poll(&pfd, 1, timeoutMs);
                    if (pr > 0) {
                        int soerr = 0;
                        socklen_t len = sizeof(soerr);
                        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &len) == 0 && soerr == 0) break;
                        LOG_NET_DEBUG("connect to {}:{} failed: {}", host, port, strerror(soerr));
                    } else {
                        LOG_NET_DEBUG("connect to {}:{} timed out after {} ms", host, port, timeoutMs);
                    }
                }
                closeSocket(fd);
                fd = INVALID_SOCK;
            }
            freeaddrinfo(res);
            return fd;
        }

        bool sendAll(sock_t fd, const char *data, size_t len, int timeoutMs) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
            size_t total = 0;
            while (total < len) {
                ssize_t n = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
                if (n > 0) {
                    total += (size_t)n;
                    continue;
                }
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                            deadline - std::chrono::steady_clock::now()).count();
                    if (left <= 0) return false;
                    pollfd pfd{fd, POLLOUT, 0};
                    poll(&pfd, 1, (int)left);
                    continue;
                }
                LOG_NET_DEBUG("send failed fd={} err={}", fd, strerror(errno));
                return false;
            }
            return true;
        }

        uint64_t hton_u64(uint64_t v) {
            uint32_t hi = htonl((uint32_t)(v >> 32));
            uint32_t lo = htonl((uint32_t)(v & 0xFFFFFFFFULL));
            if (htonl(1) == 1) return v;
            return ((uint64_t)lo << 32) | hi;
        }

        uint64_t ntoh_u64(uint64_t v) { return hton_u64(v); }
        uint32_t ntoh_u32(uint32_t v) { return ntohl(v); }
        uint16_t ntoh_u16(uint16_t v) { return ntohs(v); }
        uint32_t hton_u32(uint32_t v) { return htonl(v); }
        uint16_t hton_u16(uint16_t v) { return htons(v); }

    } // namespace common
} // namespace peerlink
