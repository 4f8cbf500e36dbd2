/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_SIGNALING_TRANSPORT_HPP
#define PEERLINK_SIGNALING_TRANSPORT_HPP

#pragma once

#include <peerlink/common.hpp>
#include <peerlink/errors.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace peerlink::signaling {

    enum class ReceiveStatus {
        Message,
        Timeout,
        Closed
    };

/**
 * @brief Framed text connection to the rendezvous service.
 *
 * One message per frame. Implementations must allow sendText() and receiveText() to be called
 * concurrently from two different threads (signaling send-loop and receive-loop).
 */
    class SignalingTransport {
    public:
        virtual ~SignalingTransport() = default;

        virtual Status open() = 0;
        virtual Status sendText(const std::string &text) = 0;
        virtual ReceiveStatus receiveText(std::string &out, std::chrono::milliseconds timeout) = 0;
        virtual void close() = 0;
        virtual bool isOpen() const = 0;
        virtual std::string describe() const = 0;
    };

/**
 * @brief Newline-delimited JSON over a plain TCP socket.
 */
    class TcpSignalingTransport : public SignalingTransport {
    public:
        TcpSignalingTransport(std::string host, int port, int connectTimeoutMs = 5000);
        ~TcpSignalingTransport() override;

        Status open() override;
        Status sendText(const std::string &text) override;
        ReceiveStatus receiveText(std::string &out, std::chrono::milliseconds timeout) override;
        void close() override;
        bool isOpen() const override;
        std::string describe() const override;

    private:
        bool popLine(std::string &out);

        std::string host_;
        int port_;
        int connectTimeoutMs_;

        std::atomic<common::sock_t> fd_{INVALID_SOCK};
        std::mutex sendMtx_;
        std::string inBuffer_; // receive-loop only
    };

} // namespace peerlink::signaling

#endif // PEERLINK_SIGNALING_TRANSPORT_HPP
