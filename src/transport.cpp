/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/transport.hpp>

namespace peerlink::transport {

    const char *channelLabelName(ChannelLabel l) {
        switch (l) {
            case ChannelLabel::Screen:    return "screen";
            case ChannelLabel::Control:   return "control";
            case ChannelLabel::Clipboard: return "clipboard";
        }
        return "unknown";
    }

    std::optional<ChannelLabel> channelLabelFromName(const std::string &name) {
        if (name == "screen") return ChannelLabel::Screen;
        if (name == "control" || name == "input") return ChannelLabel::Control;
        if (name == "clipboard") return ChannelLabel::Clipboard;
        return std::nullopt;
    }

    ChannelOptions channelOptionsFor(ChannelLabel l) {
        switch (l) {
            case ChannelLabel::Screen:    return ChannelOptions{false, false};
            case ChannelLabel::Control:   return ChannelOptions{true, true};
            case ChannelLabel::Clipboard: return ChannelOptions{true, false};
        }
        return ChannelOptions{true, true};
    }

    const char *transportEventName(TransportEvent::Kind k) {
        switch (k) {
            case TransportEvent::Kind::LocalDescription: return "LocalDescription";
            case TransportEvent::Kind::LocalCandidate:   return "LocalCandidate";
            case TransportEvent::Kind::Connected:        return "Connected";
            case TransportEvent::Kind::Disconnected:     return "Disconnected";
            case TransportEvent::Kind::Failed:           return "Failed";
        }
        return "Unknown";
    }

} // namespace peerlink::transport
