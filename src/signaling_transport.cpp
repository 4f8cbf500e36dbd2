/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/signaling_transport.hpp>
#include <peerlink/logger.hpp>

#include <fmt/core.h>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>

namespace peerlink::signaling {

    using namespace peerlink::common;

    TcpSignalingTransport::TcpSignalingTransport(std::string host, int port, int connectTimeoutMs)
            : host_(std::move(host)), port_(port), connectTimeoutMs_(connectTimeoutMs) {}

    TcpSignalingTransport::~TcpSignalingTransport() {
        close();
    }

    std::string TcpSignalingTransport::describe() const {
        return fmt::format("tcp://{}:{}", host_, port_);
    }

    Status TcpSignalingTransport::open() {
        close();
        sock_t fd = connectTcp(host_, port_, connectTimeoutMs_);
        if (fd == INVALID_SOCK) {
            return Status::err(ErrorKind::TransportError, fmt::format("cannot connect to {}", describe()));
        }
        inBuffer_.clear();
        fd_.store(fd);
        LOG_NET_INFO("Signaling socket connected to {} (fd={})", describe(), fd);
        return success();
    }

    bool TcpSignalingTransport::isOpen() const {
        return fd_.load() != INVALID_SOCK;
    }

    void TcpSignalingTransport::close() {
        sock_t fd = fd_.exchange(INVALID_SOCK);
        if (fd != INVALID_SOCK) {
            ::shutdown(fd, SHUT_RDWR);
            closeSocket(fd);
        }
    }

    Status TcpSignalingTransport::sendText(const std::string &text) {
        sock_t fd = fd_.load();
        if (fd == INVALID_SOCK) {
            return Status::err(ErrorKind::TransportError, "signaling socket is closed");
        }
        std::string line = text;
        line.push_back('\n');

        std::lock_guard<std::mutex> lk(sendMtx_);
        if (!sendAll(fd, line.data(), line.size(), 2000)) {
            return Status::err(ErrorKind::TransportError, fmt::format("send to {} failed", describe()));
        }
        return success();
    }

    bool TcpSignalingTransport::popLine(std::string &out) {
        size_t pos = inBuffer_.find('\n');
        if (pos == std::string::npos) return false;
        out.assign(inBuffer_, 0, pos);
        if (!out.empty() && out.back() == '\r') out.pop_back();
        inBuffer_.erase(0, pos + 1);
        return true;
    }

    ReceiveStatus TcpSignalingTransport::receiveText(std::string &out, std::chrono::milliseconds timeout) {
        if (popLine(out)) return ReceiveStatus::Message;

        sock_t fd = fd_.load();
        if (fd == INVALID_SOCK) return ReceiveStatus::Closed;

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pret = poll(&pfd, 1, (int)timeout.count());
        if (pret == 0) return ReceiveStatus::Timeout;
        if (pret < 0) {
            if (errno == EINTR) return ReceiveStatus::Timeout;
            LOG_NET_WARN("poll on signaling socket failed: {}", strerror(errno));
            return ReceiveStatus::Closed;
        }

        char buf[BUFFER_SIZE];
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n == 0) {
            LOG_NET_INFO("Signaling connection closed by {}", describe());
            return ReceiveStatus::Closed;
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return ReceiveStatus::Timeout;
            LOG_NET_WARN("recv on signaling socket failed: {}", strerror(errno));
            return ReceiveStatus::Closed;
        }
        inBuffer_.append(buf, (size_t)n);
        if (inBuffer_.size() > MAX_SIGNALING_LINE && inBuffer_.find('\n') == std::string::npos) {
            LOG_NET_ERROR("Signaling line exceeds {} bytes, dropping connection", MAX_SIGNALING_LINE);
            return ReceiveStatus::Closed;
        }
        return popLine(out) ? ReceiveStatus::Message : ReceiveStatus::Timeout;
    }

} // namespace peerlink::signaling
