/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/input_event.hpp>
#include <peerlink/logger.hpp>

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include <stdexcept>

namespace peerlink::control {

    using nlohmann::json;

    namespace {

        template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

        MouseButtonId mouseButtonFromName(const std::string &s) {
            if (s == "left") return MouseButtonId::Left;
            if (s == "right") return MouseButtonId::Right;
            if (s == "middle") return MouseButtonId::Middle;
            throw std::invalid_argument(fmt::format("unknown mouse button '{}'", s));
        }

        DeviceAction deviceActionFromName(const std::string &s) {
            if (s == "restart") return DeviceAction::Restart;
            if (s == "lock") return DeviceAction::Lock;
            if (s == "sign_out") return DeviceAction::SignOut;
            if (s == "ctrl_alt_del") return DeviceAction::CtrlAltDel;
            if (s == "block_input") return DeviceAction::BlockInput;
            if (s == "unblock_input") return DeviceAction::UnblockInput;
            throw std::invalid_argument(fmt::format("unknown device action '{}'", s));
        }

        json modifiersToJson(const Modifiers &m) {
            return json{{"shift", m.shift}, {"ctrl", m.ctrl}, {"alt", m.alt}, {"meta", m.meta}};
        }

        Modifiers modifiersFromJson(const json &j) {
            Modifiers m;
            auto it = j.find("modifiers");
            if (it == j.end() || it->is_null()) return m;
            m.shift = it->value("shift", false);
            m.ctrl = it->value("ctrl", false);
            m.alt = it->value("alt", false);
            m.meta = it->value("meta", false);
            return m;
        }

        struct PayloadWriter {
            json &j;

            void operator()(const MouseMove &e) const {
                j["x"] = e.x;
                j["y"] = e.y;
            }
            void operator()(const MouseButton &e) const {
                j["button"] = mouseButtonName(e.button);
                j["pressed"] = e.pressed;
                j["x"] = e.x;
                j["y"] = e.y;
            }
            void operator()(const MouseWheel &e) const {
                j["delta_x"] = e.deltaX;
                j["delta_y"] = e.deltaY;
            }
            void operator()(const KeyDown &e) const {
                j["key_code"] = e.keyCode;
                j["modifiers"] = modifiersToJson(e.modifiers);
            }
            void operator()(const KeyUp &e) const {
                j["key_code"] = e.keyCode;
                j["modifiers"] = modifiersToJson(e.modifiers);
            }
            void operator()(const DeviceActionRequest &e) const { j["action"] = deviceActionName(e.action); }
            void operator()(const ClipboardUpdate &e) const { j["text"] = e.text; }
        };

        ControlPayload decodePayload(const std::string &type, const json &j) {
            if (type == "MouseMove") return MouseMove{j.at("x").get<int32_t>(), j.at("y").get<int32_t>()};
            if (type == "MouseButton") {
                MouseButton e;
                e.button = mouseButtonFromName(j.at("button").get<std::string>());
                e.pressed = j.at("pressed").get<bool>();
                e.x = j.value("x", 0);
                e.y = j.value("y", 0);
                return e;
            }
            if (type == "MouseWheel") return MouseWheel{j.value("delta_x", 0), j.value("delta_y", 0)};
            if (type == "KeyDown") return KeyDown{j.at("key_code").get<uint32_t>(), modifiersFromJson(j)};
            if (type == "KeyUp") return KeyUp{j.at("key_code").get<uint32_t>(), modifiersFromJson(j)};
            if (type == "DeviceAction") return DeviceActionRequest{deviceActionFromName(j.at("action").get<std::string>())};
            if (type == "ClipboardUpdate") return ClipboardUpdate{j.at("text").get<std::string>()};
            throw std::invalid_argument(fmt::format("unknown control type '{}'", type));
        }

    } // namespace

    const char *mouseButtonName(MouseButtonId b) {
        switch (b) {
            case MouseButtonId::Left:   return "left";
            case MouseButtonId::Right:  return "right";
            case MouseButtonId::Middle: return "middle";
        }
        return "unknown";
    }

    const char *deviceActionName(DeviceAction a) {
        switch (a) {
            case DeviceAction::Restart:      return "restart";
            case DeviceAction::Lock:         return "lock";
            case DeviceAction::SignOut:      return "sign_out";
            case DeviceAction::CtrlAltDel:   return "ctrl_alt_del";
            case DeviceAction::BlockInput:   return "block_input";
            case DeviceAction::UnblockInput: return "unblock_input";
        }
        return "unknown";
    }

    const char *controlTypeName(const ControlPayload &p) {
        return std::visit(overloaded{
            [](const MouseMove &) { return "MouseMove"; },
            [](const MouseButton &) { return "MouseButton"; },
            [](const MouseWheel &) { return "MouseWheel"; },
            [](const KeyDown &) { return "KeyDown"; },
            [](const KeyUp &) { return "KeyUp"; },
            [](const DeviceActionRequest &) { return "DeviceAction"; },
            [](const ClipboardUpdate &) { return "ClipboardUpdate"; },
        }, p);
    }

    Capability requiredCapability(DeviceAction a) {
        switch (a) {
            case DeviceAction::Restart:      return Capability::RestartDevice;
            case DeviceAction::Lock:         return Capability::LockDevice;
            case DeviceAction::SignOut:      return Capability::SignOutUser;
            case DeviceAction::CtrlAltDel:   return Capability::SendCtrlAltDel;
            case DeviceAction::BlockInput:
            case DeviceAction::UnblockInput: return Capability::BlockInputDevices;
        }
        return Capability::BlockInputDevices;
    }

    Capability requiredCapability(const ControlPayload &p) {
        return std::visit(overloaded{
            [](const MouseMove &) { return Capability::ControlMouse; },
            [](const MouseButton &) { return Capability::ControlMouse; },
            [](const MouseWheel &) { return Capability::ControlMouse; },
            [](const KeyDown &) { return Capability::ControlKeyboard; },
            [](const KeyUp &) { return Capability::ControlKeyboard; },
            [](const DeviceActionRequest &r) { return requiredCapability(r.action); },
            [](const ClipboardUpdate &) { return Capability::ClipboardAccess; },
        }, p);
    }

    std::string encodeControl(const ControlMessage &msg) {
        json j;
        j["seq"] = msg.seq;
        j["type"] = controlTypeName(msg.payload);
        std::visit(PayloadWriter{j}, msg.payload);
        return j.dump();
    }

    Result<ControlMessage> decodeControl(const std::string &text) {
        try {
            json j = json::parse(text);
            if (!j.is_object()) {
                return Result<ControlMessage>::err(ErrorKind::ProtocolError, "control message is not a JSON object");
            }
            auto seq = j.find("seq");
            if (seq == j.end() || !seq->is_number_unsigned()) {
                return Result<ControlMessage>::err(ErrorKind::ProtocolError, "missing or negative \"seq\"");
            }
            auto t = j.find("type");
            if (t == j.end() || !t->is_string()) {
                return Result<ControlMessage>::err(ErrorKind::ProtocolError, "missing \"type\" discriminator");
            }
            ControlMessage m;
            m.seq = seq->get<uint64_t>();
            m.payload = decodePayload(t->get<std::string>(), j);
            return m;
        } catch (const json::exception &e) {
            return Result<ControlMessage>::err(ErrorKind::ProtocolError, e.what());
        } catch (const std::invalid_argument &e) {
            return Result<ControlMessage>::err(ErrorKind::ProtocolError, e.what());
        }
    }

    // ---------------- LoggingInputInjector ----------------

    Status LoggingInputInjector::inject(const InputEvent &event) {
        std::visit(overloaded{
            [](const MouseMove &e) { LOG_CTRL_TRACE("inject mouse move {},{}", e.x, e.y); },
            [](const MouseButton &e) {
                LOG_CTRL_DEBUG("inject mouse {} {} at {},{}", mouseButtonName(e.button), e.pressed ? "down" : "up", e.x, e.y);
            },
            [](const MouseWheel &e) { LOG_CTRL_DEBUG("inject wheel {},{}", e.deltaX, e.deltaY); },
            [](const KeyDown &e) { LOG_CTRL_DEBUG("inject key down {:#x}", e.keyCode); },
            [](const KeyUp &e) { LOG_CTRL_DEBUG("inject key up {:#x}", e.keyCode); },
        }, event);
        return success();
    }

    Status LoggingInputInjector::performDeviceAction(DeviceAction action) {
        LOG_CTRL_INFO("device action requested: {}", deviceActionName(action));
        return success();
    }

    Status LoggingInputInjector::applyClipboard(const std::string &text) {
        LOG_CTRL_INFO("clipboard update ({} bytes)", text.size());
        return success();
    }

} // namespace peerlink::control
