/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/control_channel.hpp>
#include <peerlink/logger.hpp>

#include <type_traits>
#include <variant>

namespace peerlink::control {

    const char *processOutcomeName(ProcessOutcome o) {
        switch (o) {
            case ProcessOutcome::Injected:     return "injected";
            case ProcessOutcome::Duplicate:    return "duplicate";
            case ProcessOutcome::Disabled:     return "disabled";
            case ProcessOutcome::Denied:       return "denied";
            case ProcessOutcome::InjectFailed: return "inject-failed";
            case ProcessOutcome::Malformed:    return "malformed";
        }
        return "unknown";
    }

    ControlChannel::ControlChannel(std::shared_ptr<InputInjector> injector, PermissionProfile profile)
            : injector_(std::move(injector)), profile_(std::move(profile)) {}

    ControlChannel::~ControlChannel() {
        detach();
    }

    void ControlChannel::setProfile(PermissionProfile profile) {
        std::lock_guard<std::mutex> lk(mtx_);
        LOG_CTRL_INFO("permission profile {} -> {}", profile_.name(), profile.name());
        profile_ = std::move(profile);
    }

    PermissionProfile ControlChannel::profile() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return profile_;
    }

    void ControlChannel::setEnabled(bool enabled) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (enabled_ != enabled) LOG_CTRL_INFO("remote control {}", enabled ? "enabled" : "disabled");
        enabled_ = enabled;
    }

    bool ControlChannel::enabled() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return enabled_;
    }

    void ControlChannel::setDeniedHandler(DeniedHandler handler) {
        std::lock_guard<std::mutex> lk(handlerMtx_);
        deniedHandler_ = std::move(handler);
    }

    ControlStats ControlChannel::stats() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return stats_;
    }

    std::optional<uint64_t> ControlChannel::lastSeq() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return lastSeq_;
    }

    ProcessOutcome ControlChannel::handleRaw(const std::string &text) {
        Result<ControlMessage> r = decodeControl(text);
        if (!r) {
            LOG_CTRL_WARN("dropping malformed control message: {}", r.error().message);
            std::lock_guard<std::mutex> lk(mtx_);
            ++stats_.malformed;
            return ProcessOutcome::Malformed;
        }
        return handle(r.value());
    }

    ProcessOutcome ControlChannel::handle(const ControlMessage &msg) {
        std::optional<PermissionDeniedEvent> denial;
        ProcessOutcome outcome;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++stats_.received;

            if (lastSeq_ && msg.seq <= *lastSeq_) {
                ++stats_.duplicates;
                LOG_CTRL_TRACE("discarding seq {} (last {})", msg.seq, *lastSeq_);
                return ProcessOutcome::Duplicate;
            }
            if (lastSeq_ && msg.seq > *lastSeq_ + 1) {
                uint64_t missing = msg.seq - *lastSeq_ - 1;
                ++stats_.gaps;
                stats_.missing += missing;
                LOG_CTRL_WARN("control seq gap: {} -> {} ({} lost)", *lastSeq_, msg.seq, missing);
            }
            lastSeq_ = msg.seq;

            if (!enabled_) {
                ++stats_.disabledDrops;
                LOG_CTRL_DEBUG("remote control disabled, dropping {} #{}", controlTypeName(msg.payload), msg.seq);
                return ProcessOutcome::Disabled;
            }

            Capability need = requiredCapability(msg.payload);
            if (!profile_.allows(need)) {
                ++stats_.denied;
                LOG_CTRL_WARN("permission denied: {} #{} needs {} (profile {})", controlTypeName(msg.payload), msg.seq,
                              capabilityName(need), profile_.name());
                denial = PermissionDeniedEvent{msg.seq, need, controlTypeName(msg.payload), profile_.name(),
                                               std::chrono::system_clock::now()};
                outcome = ProcessOutcome::Denied;
            } else {
                outcome = dispatch(msg);
                if (outcome == ProcessOutcome::Injected) ++stats_.injected;
                else ++stats_.injectFailures;
            }
        }

        if (denial) {
            DeniedHandler handler;
            {
                std::lock_guard<std::mutex> lk(handlerMtx_);
                handler = deniedHandler_;
            }
            if (handler) {
                try {
                    handler(*denial);
                } catch (const std::exception &e) {
                    LOG_CTRL_ERROR("permission-denied handler threw: {}", e.what());
                }
            }
        }
        return outcome;
    }

    // Called with mtx_ held; the injector call runs to completion before the next event.
    ProcessOutcome ControlChannel::dispatch(const ControlMessage &msg) {
        Status st = std::visit([this](const auto &p) -> Status {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, DeviceActionRequest>) {
                return injector_->performDeviceAction(p.action);
            } else if constexpr (std::is_same_v<T, ClipboardUpdate>) {
                return injector_->applyClipboard(p.text);
            } else {
                return injector_->inject(InputEvent(p));
            }
        }, msg.payload);

        if (!st) {
            LOG_CTRL_WARN("injector failed on {} #{}: {}", controlTypeName(msg.payload), msg.seq, st.error().message);
            return ProcessOutcome::InjectFailed;
        }
        return ProcessOutcome::Injected;
    }

    void ControlChannel::attach(std::shared_ptr<transport::MediaChannel> channel) {
        detach();
        if (!channel) return;
        stop_.store(false);
        thread_ = std::thread(&ControlChannel::receiveLoop, this, std::move(channel));
    }

    void ControlChannel::detach() {
        stop_.store(true);
        if (thread_.joinable()) thread_.join();
    }

    void ControlChannel::receiveLoop(std::shared_ptr<transport::MediaChannel> channel) {
        LOG_CTRL_DEBUG("control receive-loop started on '{}'", transport::channelLabelName(channel->label()));
        bool seenOpen = false;
        while (!stop_.load()) {
            auto data = channel->receive(std::chrono::milliseconds(100));
            if (!data) {
                bool open = channel->isOpen();
                if (!open && seenOpen) break;
                seenOpen = seenOpen || open;
                continue;
            }
            seenOpen = true;
            handleRaw(std::string(data->begin(), data->end()));
        }
        LOG_CTRL_DEBUG("control receive-loop exiting");
    }

} // namespace peerlink::control
