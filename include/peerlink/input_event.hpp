/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_INPUT_EVENT_HPP
#define PEERLINK_INPUT_EVENT_HPP

#pragma once

#include <peerlink/errors.hpp>
#include <peerlink/permissions.hpp>

#include <cstdint>
#include <string>
#include <variant>

namespace peerlink::control {

    enum class MouseButtonId {
        Left,
        Right,
        Middle
    };

    struct Modifiers {
        bool shift{false};
        bool ctrl{false};
        bool alt{false};
        bool meta{false};

        bool operator==(const Modifiers &o) const {
            return shift == o.shift && ctrl == o.ctrl && alt == o.alt && meta == o.meta;
        }
    };

    struct MouseMove {
        int32_t x{0};
        int32_t y{0};
    };

    struct MouseButton {
        MouseButtonId button{MouseButtonId::Left};
        bool pressed{false};
        int32_t x{0};
        int32_t y{0};
    };

    struct MouseWheel {
        int32_t deltaX{0};
        int32_t deltaY{0};
    };

    struct KeyDown {
        uint32_t keyCode{0};
        Modifiers modifiers;
    };

    struct KeyUp {
        uint32_t keyCode{0};
        Modifiers modifiers;
    };

    using InputEvent = std::variant<MouseMove, MouseButton, MouseWheel, KeyDown, KeyUp>;

    enum class DeviceAction {
        Restart,
        Lock,
        SignOut,
        CtrlAltDel,
        BlockInput,
        UnblockInput
    };

    struct DeviceActionRequest {
        DeviceAction action{DeviceAction::Lock};
    };

    struct ClipboardUpdate {
        std::string text;
    };

    /// Everything that can arrive on the control channel.
    using ControlPayload = std::variant<MouseMove, MouseButton, MouseWheel, KeyDown, KeyUp,
                                        DeviceActionRequest, ClipboardUpdate>;

    struct ControlMessage {
        uint64_t seq{0};
        ControlPayload payload;
    };

    const char *mouseButtonName(MouseButtonId b);
    const char *deviceActionName(DeviceAction a);

    /// Wire "type" of the payload ("MouseMove", ..., "DeviceAction", "ClipboardUpdate").
    const char *controlTypeName(const ControlPayload &p);

    /// Capability that must be granted for the payload to be acted on.
    Capability requiredCapability(const ControlPayload &p);
    Capability requiredCapability(DeviceAction a);

    /// {"seq":N,"type":"MouseMove","x":..,"y":..}
    std::string encodeControl(const ControlMessage &msg);

    /// ProtocolError on malformed JSON, unknown type or missing fields.
    Result<ControlMessage> decodeControl(const std::string &text);

/**
 * @brief Platform input injection, implemented outside the core.
 */
    class InputInjector {
    public:
        virtual ~InputInjector() = default;

        virtual Status inject(const InputEvent &event) = 0;
        virtual Status performDeviceAction(DeviceAction action) = 0;
        virtual Status applyClipboard(const std::string &text) = 0;
    };

/**
 * @brief Injector that only logs what it would do. Used by the host binary when no platform layer is linked.
 */
    class LoggingInputInjector : public InputInjector {
    public:
        Status inject(const InputEvent &event) override;
        Status performDeviceAction(DeviceAction action) override;
        Status applyClipboard(const std::string &text) override;
    };

} // namespace peerlink::control

#endif // PEERLINK_INPUT_EVENT_HPP
