/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_CONTROL_CHANNEL_HPP
#define PEERLINK_CONTROL_CHANNEL_HPP

#pragma once

#include <peerlink/input_event.hpp>
#include <peerlink/permissions.hpp>
#include <peerlink/transport.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace peerlink::control {

    /// Audit record for an event dropped by the permission check.
    struct PermissionDeniedEvent {
        uint64_t seq{0};
        Capability capability{Capability::ControlMouse};
        std::string eventType;
        std::string profile;
        std::chrono::system_clock::time_point at;
    };

    enum class ProcessOutcome {
        Injected,
        Duplicate,      // seq <= last processed
        Disabled,       // session toggle off
        Denied,
        InjectFailed,
        Malformed
    };

    const char *processOutcomeName(ProcessOutcome o);

    struct ControlStats {
        uint64_t received{0};
        uint64_t injected{0};
        uint64_t duplicates{0};
        uint64_t gaps{0};
        uint64_t missing{0};        // total sequence numbers skipped over by gaps
        uint64_t denied{0};
        uint64_t disabledDrops{0};
        uint64_t injectFailures{0};
        uint64_t malformed{0};
    };

/**
 * @brief Permission-gated consumer of the `control` channel.
 *
 * Messages are processed in strictly ascending seq order: a seq at or below the last processed one is
 * discarded silently, a jump forward is logged and the missing numbers are skipped. Every processed seq
 * advances the cursor, whether the event is injected, denied or dropped by the toggle.
 * A denied event never closes the session.
 */
    class ControlChannel {
    public:
        using DeniedHandler = std::function<void(const PermissionDeniedEvent&)>;

        ControlChannel(std::shared_ptr<InputInjector> injector, PermissionProfile profile);
        ~ControlChannel();

        ControlChannel(const ControlChannel&) = delete;
        ControlChannel& operator=(const ControlChannel&) = delete;

        ProcessOutcome handle(const ControlMessage &msg);

        /// Decodes then handles. Malformed input is logged and dropped.
        ProcessOutcome handleRaw(const std::string &text);

        void setProfile(PermissionProfile profile);
        PermissionProfile profile() const;

        void setEnabled(bool enabled);
        bool enabled() const;

        void setDeniedHandler(DeniedHandler handler);

        ControlStats stats() const;
        std::optional<uint64_t> lastSeq() const;

        /// Starts the control receive-loop on `channel`. Replaces a previous attachment.
        void attach(std::shared_ptr<transport::MediaChannel> channel);
        void detach();

    private:
        void receiveLoop(std::shared_ptr<transport::MediaChannel> channel);
        ProcessOutcome dispatch(const ControlMessage &msg);

        std::shared_ptr<InputInjector> injector_;

        mutable std::mutex mtx_;
        PermissionProfile profile_;
        bool enabled_{true};
        std::optional<uint64_t> lastSeq_;
        ControlStats stats_;

        std::mutex handlerMtx_;
        DeniedHandler deniedHandler_;

        std::atomic<bool> stop_{false};
        std::thread thread_;
    };

} // namespace peerlink::control

#endif // PEERLINK_CONTROL_CHANNEL_HPP
