/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_RENDEZVOUS_SERVER_HPP
#define PEERLINK_RENDEZVOUS_SERVER_HPP

#pragma once

#include <peerlink/common.hpp>
#include <peerlink/peer_directory.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace peerlink::rendezvous {

    using peerlink::common::sock_t;

    struct ServerConfig {
        int port{common::DEFAULT_RENDEZVOUS_PORT};     // 0 picks a free port (see boundPort())
        std::chrono::milliseconds pingInterval{15000};
        std::chrono::milliseconds idleTimeout{45000};
        size_t maxConnections{common::MAX_PEERS};
    };

    struct Connection {
        sock_t fd{INVALID_SOCK};
        ConnId id{0};
        std::string remote;
        std::string inBuffer;   // bytes received, not yet split into lines
        std::string outBuffer;  // encoded lines waiting for the socket to drain
        bool writeArmed{false};
        bool closing{false};
        std::chrono::steady_clock::time_point lastActivity;
    };

/**
 * @brief Rendezvous service: newline-delimited JSON signaling over TCP, one epoll loop.
 *
 * Routing decisions come from PeerDirectory; this class only moves bytes. A line longer than
 * MAX_SIGNALING_LINE or an output backlog above MAX_CONNECTION_OUTBUF closes the connection.
 */
    class RendezvousServer {
    public:
        explicit RendezvousServer(ServerConfig cfg);
        ~RendezvousServer();

        RendezvousServer(const RendezvousServer&) = delete;
        RendezvousServer& operator=(const RendezvousServer&) = delete;

        bool start();

        /// Blocks until requestStop().
        void runLoop();

        /// Thread/signal-safe.
        void requestStop();

        int boundPort() const { return boundPort_; }
        size_t connectionCount() const { return clients_.size(); }

    private:
        bool setupListenSocket();
        void acceptNewConnections();
        void handleClientEvent(sock_t fd, uint32_t events);
        void readFromClient(Connection &c);
        void processLine(Connection &c, const std::string &line);
        void deliver(const DirectoryUpdate &upd);
        void queueLine(Connection &c, const std::string &line);
        void flushOutBuffer(Connection &c);
        void updateWriteInterest(Connection &c);
        void heartbeat(std::chrono::steady_clock::time_point now);
        void closeConnection(sock_t fd, const char *why);
        void sweepClosing();

        ServerConfig cfg_;
        int boundPort_{0};
        sock_t listenSocket_{INVALID_SOCK};
        int epollFd_{-1};
        int wakeFd_{-1};
        std::atomic<bool> stop_{false};

        std::unordered_map<sock_t, Connection> clients_;
        std::unordered_map<ConnId, sock_t> connFds_;
        ConnId nextConnId_{1};
        PeerDirectory directory_;
        std::chrono::steady_clock::time_point lastHeartbeat_;
    };

} // namespace peerlink::rendezvous

#endif // PEERLINK_RENDEZVOUS_SERVER_HPP
