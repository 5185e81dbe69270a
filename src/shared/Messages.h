#pragma once
#include "Protocol.h"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace FleetNet {

    enum class MessageKind : uint8_t {
        Handshake,
        Handshake_Ack,
        Error,
        Welcome,

        // --- GATEWAY ---
        User_Join,
        User_Leave,
        Channel_Join,
        Channel_Leave,

        Unknown
    };

    struct HandshakeMessage {
        std::string clientVersion;
        bool operator==(const HandshakeMessage& o) const { return clientVersion == o.clientVersion; }
    };

    struct HandshakeAckMessage {
        std::string connectionId;
        std::string serverVersion;
        bool operator==(const HandshakeAckMessage& o) const {
            return connectionId == o.connectionId && serverVersion == o.serverVersion;
        }
    };

    struct ErrorMessage {
        std::string code;
        std::string message;
        bool operator==(const ErrorMessage& o) const { return code == o.code && message == o.message; }
    };

    // Sent once per new session; secret is base64.
    struct WelcomeMessage {
        uint16_t    numericId{ 0 };
        std::string secret;
        bool operator==(const WelcomeMessage& o) const { return numericId == o.numericId && secret == o.secret; }
    };

    struct UserJoinMessage {
        uint16_t numericId{ 0 };
        bool operator==(const UserJoinMessage& o) const { return numericId == o.numericId; }
    };

    struct UserLeaveMessage {
        uint16_t numericId{ 0 };
        bool operator==(const UserLeaveMessage& o) const { return numericId == o.numericId; }
    };

    struct ChannelJoinMessage {
        ChannelId channelId{ 0 };
        bool operator==(const ChannelJoinMessage& o) const { return channelId == o.channelId; }
    };

    struct ChannelLeaveMessage {
        ChannelId channelId{ 0 };
        bool operator==(const ChannelLeaveMessage& o) const { return channelId == o.channelId; }
    };

    // A well-formed payload whose "type" is not one we know. body is the whole
    // decoded map, "type" included, so it re-encodes unchanged.
    struct UnknownMessage {
        std::string    type;
        nlohmann::json body;
        bool operator==(const UnknownMessage& o) const { return type == o.type && body == o.body; }
    };

    // Alternative order matches MessageKind.
    using Message = std::variant<
        HandshakeMessage,
        HandshakeAckMessage,
        ErrorMessage,
        WelcomeMessage,
        UserJoinMessage,
        UserLeaveMessage,
        ChannelJoinMessage,
        ChannelLeaveMessage,
        UnknownMessage>;

    inline MessageKind KindOf(const Message& m) noexcept {
        return static_cast<MessageKind>(m.index());
    }

    // Wire discriminant for a known kind; "" for Unknown.
    const char* KindName(MessageKind kind) noexcept;

    // msgpack map with a string "type" discriminant.
    std::vector<uint8_t> SerializeMessage(const Message& message);

    /// Decodes one payload. Returns false (and fills error if given) when the
    /// bytes are not msgpack, not a map, carry no string "type", or a known
    /// kind is missing a field or has one of the wrong type.
    bool DeserializeMessage(const uint8_t* data, size_t size, Message& out, std::string* error = nullptr);

} // namespace FleetNet
