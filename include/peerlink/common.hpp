/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_COMMON_HPP
#define PEERLINK_COMMON_HPP

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

#define INVALID_SOCK (-1)

namespace peerlink {
    namespace common {
        using sock_t = int;

// Constants used across rendezvous server / signaling client
        constexpr size_t BUFFER_SIZE = 4096;
        constexpr size_t MAX_PEERS = 1024;
        constexpr size_t MAX_SIGNALING_LINE = 256 * 1024;          // one JSON message (SDP blobs are a few KB)
        constexpr size_t MAX_CONNECTION_OUTBUF = 4 * 1024 * 1024;  // pending bytes to a slow peer before it is dropped
        constexpr int DEFAULT_RENDEZVOUS_PORT = 8787;

//
// Utility functions
//
        int setSocketNonBlocking(sock_t fd);
        void closeSocket(sock_t fd);
        int enableSocketKeepAliveAndNoDelay(sock_t fd);

        /// Connect a TCP socket to host:port, waiting at most timeoutMs. Returns INVALID_SOCK on failure.
        sock_t connectTcp(const std::string &host, int port, int timeoutMs);

        /// Write all bytes to a (possibly non-blocking) socket, polling for writability. False on error/timeout.
        bool sendAll(sock_t fd, const char *data, size_t len, int timeoutMs);

        uint64_t ntoh_u64(uint64_t v);
        uint64_t hton_u64(uint64_t v);
        uint32_t ntoh_u32(uint32_t v);
        uint16_t ntoh_u16(uint16_t v);
        uint32_t hton_u32(uint32_t v);
        uint16_t hton_u16(uint16_t v);

    } // namespace common
} // namespace peerlink

#endif // PEERLINK_COMMON_HPP
