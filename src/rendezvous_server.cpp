/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/rendezvous_server.hpp>
#include <peerlink/logger.hpp>

#include <cerrno>
#include <cstring>
#include <vector>

#include <sys/socket.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

using namespace peerlink::rendezvous;
using namespace peerlink::common;
using namespace peerlink::signaling;

namespace {

    int64_t unixNow() {
        return std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
    }

}

RendezvousServer::RendezvousServer(ServerConfig cfg)
        : cfg_(cfg), lastHeartbeat_(std::chrono::steady_clock::now()) {}

RendezvousServer::~RendezvousServer() {
    std::vector<sock_t> fds;
    for (auto &kv : clients_) fds.push_back(kv.first);
    for (sock_t fd : fds) closeSocket(fd);
    if (epollFd_ >= 0) close(epollFd_);
    if (wakeFd_ >= 0) close(wakeFd_);
    if (listenSocket_ != INVALID_SOCK) closeSocket(listenSocket_);
}

bool RendezvousServer::setupListenSocket() {
    listenSocket_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenSocket_ == INVALID_SOCK) {
        LOG_GEN_ERROR("Failed to create listen socket: {}", strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(listenSocket_, SOL_SOCKET, SO_REUSEADDR, (char*)&opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(cfg_.port));

    if (bind(listenSocket_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        LOG_GEN_ERROR("bind failed on port {}: {}", cfg_.port, strerror(errno));
        closeSocket(listenSocket_);
        listenSocket_ = INVALID_SOCK;
        return false;
    }

    if (setSocketNonBlocking(listenSocket_) < 0) {
        LOG_GEN_ERROR("set nonblocking failed for listen socket");
        closeSocket(listenSocket_);
        listenSocket_ = INVALID_SOCK;
        return false;
    }

    if (listen(listenSocket_, 64) < 0) {
        LOG_GEN_ERROR("listen failed: {}", strerror(errno));
        closeSocket(listenSocket_);
        listenSocket_ = INVALID_SOCK;
        return false;
    }

    socklen_t alen = sizeof(addr);
    if (getsockname(listenSocket_, (sockaddr*)&addr, &alen) == 0) boundPort_ = ntohs(addr.sin_port);
    else boundPort_ = cfg_.port;

    LOG_GEN_INFO("Listening on TCP port {}", boundPort_);
    return true;
}

bool RendezvousServer::start() {
    if (!setupListenSocket()) return false;

    epollFd_ = epoll_create1(0);
    if (epollFd_ < 0) {
        LOG_GEN_ERROR("epoll_create1: {}", strerror(errno));
        return false;
    }
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = listenSocket_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, listenSocket_, &ev) < 0) {
        LOG_GEN_ERROR("epoll_ctl add listen: {}", strerror(errno));
        return false;
    }

    wakeFd_ = eventfd(0, EFD_NONBLOCK);
    if (wakeFd_ < 0) {
        LOG_GEN_ERROR("eventfd: {}", strerror(errno));
        return false;
    }
    ev.events = EPOLLIN;
    ev.data.fd = wakeFd_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeFd_, &ev) < 0) {
        LOG_GEN_ERROR("epoll_ctl add wakefd: {}", strerror(errno));
        return false;
    }

    LOG_GEN_INFO("Rendezvous server started on TCP port {} (ping {} ms, idle timeout {} ms)", boundPort_,
                 cfg_.pingInterval.count(), cfg_.idleTimeout.count());
    return true;
}

void RendezvousServer::requestStop() {
    stop_.store(true);
    if (wakeFd_ >= 0) {
        uint64_t one = 1;
        ssize_t w = write(wakeFd_, &one, sizeof(one));
        (void)w; // a full counter already wakes the loop
    }
}

void RendezvousServer::runLoop() {
    std::vector<epoll_event> events(64);
    while (!stop_.load()) {
        int n = epoll_wait(epollFd_, events.data(), (int)events.size(), 1000);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_GEN_ERROR("epoll_wait: {}", strerror(errno));
            break;
        }
        for (int i = 0; i < n; ++i) {
            int fd = events[i].data.fd;
            uint32_t ev = events[i].events;
            if (fd == listenSocket_) {
                acceptNewConnections();
            } else if (fd == wakeFd_) {
                uint64_t v;
                while (read(wakeFd_, &v, sizeof(v)) > 0) {}
            } else if (clients_.count(fd)) {
                handleClientEvent(fd, ev);
            }
        }

        heartbeat(std::chrono::steady_clock::now());
        sweepClosing();
    }
    LOG_GEN_INFO("Rendezvous loop exiting ({} connections)", clients_.size());
}

void RendezvousServer::acceptNewConnections() {
    while (true) {
        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        sock_t cfd = accept(listenSocket_, (sockaddr*)&caddr, &clen);
        if (cfd == INVALID_SOCK) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            LOG_NET_WARN("accept: {}", strerror(errno));
            break;
        }
        if (clients_.size() >= cfg_.maxConnections) {
            LOG_NET_WARN("connection limit {} reached, refusing fd={}", cfg_.maxConnections, (long long)cfd);
            closeSocket(cfd);
            continue;
        }
        if (setSocketNonBlocking(cfd) < 0) {
            LOG_GEN_ERROR("set nonblocking for client failed");
            closeSocket(cfd);
            continue;
        }

        // enable keepalive and TCP_NODELAY for accepted socket
        enableSocketKeepAliveAndNoDelay(cfd);

        epoll_event cev{};
        cev.events = EPOLLIN | EPOLLRDHUP | EPOLLHUP;
        cev.data.fd = cfd;
        if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, cfd, &cev) < 0) {
            LOG_NET_ERROR("epoll_ctl add client: {}", strerror(errno));
            closeSocket(cfd);
            continue;
        }

        char hostbuf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &caddr.sin_addr, hostbuf, sizeof(hostbuf));

        Connection conn;
        conn.fd = cfd;
        conn.id = nextConnId_++;
        conn.remote = std::string(hostbuf) + ":" + std::to_string(ntohs(caddr.sin_port));
        conn.lastActivity = std::chrono::steady_clock::now();
        connFds_[conn.id] = cfd;
        LOG_NET_INFO("Accepted connection from {} fd={} conn=#{}", conn.remote, (long long)cfd, conn.id);
        clients_.emplace(cfd, std::move(conn));
    }
}

void RendezvousServer::handleClientEvent(sock_t fd, uint32_t events) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return;
    Connection &conn = it->second;

    if (events & EPOLLIN) readFromClient(conn);
    if (!conn.closing && (events & EPOLLOUT)) flushOutBuffer(conn);
    if (events & (EPOLLERR | EPOLLHUP | EPOLLRDHUP)) {
        if (!conn.closing) LOG_NET_INFO("peer hung up conn=#{}", conn.id);
        conn.closing = true;
    }
}

void RendezvousServer::readFromClient(Connection &conn) {
    char buf[BUFFER_SIZE];
    while (!conn.closing) {
        ssize_t n = recv(conn.fd, buf, sizeof(buf), 0);
        if (n > 0) {
            conn.inBuffer.append(buf, buf + n);
            conn.lastActivity = std::chrono::steady_clock::now();

            size_t pos;
            while (!conn.closing && (pos = conn.inBuffer.find('\n')) != std::string::npos) {
                std::string line = conn.inBuffer.substr(0, pos);
                conn.inBuffer.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) processLine(conn, line);
            }
            if (conn.inBuffer.size() > MAX_SIGNALING_LINE) {
                LOG_NET_WARN("conn=#{} exceeded {} bytes without a newline, closing", conn.id, MAX_SIGNALING_LINE);
                conn.closing = true;
            }
        } else if (n == 0) {
            LOG_NET_INFO("peer closed connection conn=#{}", conn.id);
            conn.closing = true;
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            LOG_NET_WARN("recv error on conn=#{}: {}", conn.id, strerror(errno));
            conn.closing = true;
        }
    }
}

void RendezvousServer::processLine(Connection &conn, const std::string &line) {
    Result<SignalingMessage> r = decode(line);
    if (!r) {
        LOG_SIG_WARN("malformed message from conn=#{} dropped: {}", conn.id, r.error().message);
        return;
    }
    deliver(directory_.onMessage(conn.id, r.value(), unixNow()));
}

void RendezvousServer::deliver(const DirectoryUpdate &upd) {
    for (const auto &o : upd.out) {
        auto fit = connFds_.find(o.conn);
        if (fit == connFds_.end()) continue;
        auto cit = clients_.find(fit->second);
        if (cit == clients_.end() || cit->second.closing) continue;
        queueLine(cit->second, encode(o.msg));
    }
    if (upd.evict) {
        auto fit = connFds_.find(*upd.evict);
        if (fit != connFds_.end()) {
            auto cit = clients_.find(fit->second);
            if (cit != clients_.end()) {
                LOG_NET_INFO("closing superseded conn=#{}", *upd.evict);
                cit->second.closing = true;
            }
        }
    }
}

void RendezvousServer::queueLine(Connection &c, const std::string &line) {
    if (c.outBuffer.size() + line.size() + 1 > MAX_CONNECTION_OUTBUF) {
        LOG_NET_WARN("conn=#{} backlog above {} bytes, dropping slow peer", c.id, MAX_CONNECTION_OUTBUF);
        c.closing = true;
        return;
    }
    c.outBuffer.append(line);
    c.outBuffer.push_back('\n');
    flushOutBuffer(c);
}

void RendezvousServer::flushOutBuffer(Connection &c) {
    while (!c.outBuffer.empty()) {
        ssize_t n = send(c.fd, c.outBuffer.data(), c.outBuffer.size(), MSG_NOSIGNAL);
        if (n > 0) {
            c.outBuffer.erase(0, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        LOG_NET_WARN("send error on conn=#{}: {}", c.id, n < 0 ? strerror(errno) : "zero bytes written");
        c.closing = true;
        return;
    }
    updateWriteInterest(c);
}

void RendezvousServer::updateWriteInterest(Connection &c) {
    bool want = !c.outBuffer.empty();
    if (want == c.writeArmed) return;
    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLRDHUP | EPOLLHUP | (want ? EPOLLOUT : 0u);
    ev.data.fd = c.fd;
    if (epoll_ctl(epollFd_, EPOLL_CTL_MOD, c.fd, &ev) < 0) {
        LOG_NET_ERROR("epoll_ctl mod conn=#{}: {}", c.id, strerror(errno));
        c.closing = true;
        return;
    }
    c.writeArmed = want;
}

void RendezvousServer::heartbeat(std::chrono::steady_clock::time_point now) {
    if (now - lastHeartbeat_ < cfg_.pingInterval) return;
    lastHeartbeat_ = now;

    for (auto &kv : clients_) {
        Connection &c = kv.second;
        if (c.closing) continue;
        if (now - c.lastActivity > cfg_.idleTimeout) {
            LOG_NET_INFO("conn=#{} idle for more than {} ms, closing", c.id, cfg_.idleTimeout.count());
            c.closing = true;
            continue;
        }
        auto peer = directory_.peerFor(c.id);
        if (peer) queueLine(c, encode(makeMessage(serviceId(), *peer, Ping{})));
    }
}

void RendezvousServer::sweepClosing() {
    std::vector<sock_t> doomed;
    for (auto &kv : clients_) {
        if (kv.second.closing) doomed.push_back(kv.first);
    }
    for (sock_t fd : doomed) closeConnection(fd, "closing");
}

void RendezvousServer::closeConnection(sock_t fd, const char *why) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return;
    ConnId id = it->second.id;

    epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
    closeSocket(fd);
    connFds_.erase(id);
    clients_.erase(it);
    LOG_NET_DEBUG("conn=#{} closed ({})", id, why);

    // PeerLeft goes out after the socket is gone so the leaver is not among the recipients
    deliver(directory_.onDisconnect(id));
}
