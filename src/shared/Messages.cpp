#include "Messages.h"

using json = nlohmann::json;

namespace {

    // from_msgpack recurses once per container; keep that bounded.
    constexpr size_t kMaxNestingDepth = 64;

    constexpr const char* kKindNames[] = {
        "handshake",
        "handshake_ack",
        "error",
        "welcome",
        "user_join",
        "user_leave",
        "channel_join",
        "channel_leave",
    };
    constexpr size_t kKnownKindCount = sizeof(kKindNames) / sizeof(kKindNames[0]);

    bool Fail(std::string* error, const std::string& reason) {
        if (error) *error = reason;
        return false;
    }

    bool ReadString(const json& j, const char* key, std::string& out) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) return false;
        out = it->get<std::string>();
        return true;
    }

    // Other msgpack encoders may store small positive values as signed ints.
    bool ReadU16(const json& j, const char* key, uint16_t& out) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number_integer()) return false;
        if (it->is_number_unsigned()) {
            const uint64_t v = it->get<uint64_t>();
            if (v > 0xFFFFu) return false;
            out = static_cast<uint16_t>(v);
            return true;
        }
        const int64_t v = it->get<int64_t>();
        if (v < 0 || v > 0xFFFF) return false;
        out = static_cast<uint16_t>(v);
        return true;
    }

    // Walks the msgpack headers iteratively. Rejects nesting deeper than
    // kMaxNestingDepth and containers that run past the end of the payload.
    bool CheckNesting(const uint8_t* data, size_t size, std::string& reason) {
        std::vector<uint64_t> pending;   // children still owed by each open container
        size_t pos = 0;

        auto skip = [&](size_t n) {
            if (size - pos < n) return false;
            pos += n;
            return true;
        };
        auto readLength = [&](size_t width, uint64_t& out) {
            if (size - pos < width) return false;
            out = width == 1 ? data[pos] : width == 2 ? FleetNet::ReadU16BE(data + pos) : FleetNet::ReadU32BE(data + pos);
            pos += width;
            return true;
        };

        do {
            if (pos >= size) {
                reason = "truncated msgpack payload";
                return false;
            }
            const uint8_t b = data[pos++];
            uint64_t children = 0;
            uint64_t length = 0;
            bool ok = true;

            if (b <= 0x7f || b >= 0xe0 || b == 0xc0 || b == 0xc2 || b == 0xc3) {
                // positive/negative fixint, nil, bool
            }
            else if (b <= 0x8f) children = static_cast<uint64_t>(b & 0x0f) * 2;
            else if (b <= 0x9f) children = b & 0x0f;
            else if (b <= 0xbf) ok = skip(b & 0x1f);
            else {
                switch (b) {
                case 0xc4: case 0xd9: ok = readLength(1, length) && skip(static_cast<size_t>(length)); break;
                case 0xc5: case 0xda: ok = readLength(2, length) && skip(static_cast<size_t>(length)); break;
                case 0xc6: case 0xdb: ok = readLength(4, length) && skip(static_cast<size_t>(length)); break;
                case 0xc7: ok = readLength(1, length) && skip(1 + static_cast<size_t>(length)); break;
                case 0xc8: ok = readLength(2, length) && skip(1 + static_cast<size_t>(length)); break;
                case 0xc9: ok = readLength(4, length) && skip(1 + static_cast<size_t>(length)); break;
                case 0xca: case 0xce: case 0xd2: ok = skip(4); break;
                case 0xcb: case 0xcf: case 0xd3: ok = skip(8); break;
                case 0xcc: case 0xd0: ok = skip(1); break;
                case 0xcd: case 0xd1: ok = skip(2); break;
                case 0xd4: ok = skip(2); break;
                case 0xd5: ok = skip(3); break;
                case 0xd6: ok = skip(5); break;
                case 0xd7: ok = skip(9); break;
                case 0xd8: ok = skip(17); break;
                case 0xdc: ok = readLength(2, children); break;
                case 0xdd: ok = readLength(4, children); break;
                case 0xde: ok = readLength(2, children); children *= 2; break;
                case 0xdf: ok = readLength(4, children); children *= 2; break;
                default:
                    reason = "invalid msgpack type byte";
                    return false;
                }
            }
            if (!ok) {
                reason = "truncated msgpack payload";
                return false;
            }

            if (children > 0) {
                if (pending.size() >= kMaxNestingDepth) {
                    reason = "msgpack payload nested too deeply";
                    return false;
                }
                pending.push_back(children);
                continue;
            }
            // A complete value closes every container it was the last child of.
            while (!pending.empty()) {
                if (--pending.back() > 0) break;
                pending.pop_back();
            }
        } while (!pending.empty());
        return true;
    }

    struct PayloadWriter {
        json& j;

        void operator()(const FleetNet::HandshakeMessage& m) const {
            j["clientVersion"] = m.clientVersion;
        }
        void operator()(const FleetNet::HandshakeAckMessage& m) const {
            j["connectionId"] = m.connectionId;
            j["serverVersion"] = m.serverVersion;
        }
        void operator()(const FleetNet::ErrorMessage& m) const {
            j["code"] = m.code;
            j["message"] = m.message;
        }
        void operator()(const FleetNet::WelcomeMessage& m) const {
            j["numericId"] = m.numericId;
            j["secret"] = m.secret;
        }
        void operator()(const FleetNet::UserJoinMessage& m) const { j["numericId"] = m.numericId; }
        void operator()(const FleetNet::UserLeaveMessage& m) const { j["numericId"] = m.numericId; }
        void operator()(const FleetNet::ChannelJoinMessage& m) const { j["channelId"] = m.channelId; }
        void operator()(const FleetNet::ChannelLeaveMessage& m) const { j["channelId"] = m.channelId; }
        void operator()(const FleetNet::UnknownMessage& m) const {
            if (m.body.is_object()) j = m.body;
            j["type"] = m.type;
        }
    };

} // namespace

namespace FleetNet {

    const char* KindName(MessageKind kind) noexcept {
        const auto idx = static_cast<size_t>(kind);
        return idx < kKnownKindCount ? kKindNames[idx] : "";
    }

    std::vector<uint8_t> SerializeMessage(const Message& message) {
        json j = json::object();
        const MessageKind kind = KindOf(message);
        if (kind != MessageKind::Unknown) j["type"] = KindName(kind);
        std::visit(PayloadWriter{ j }, message);
        return json::to_msgpack(j);
    }

    bool DeserializeMessage(const uint8_t* data, size_t size, Message& out, std::string* error) {
        std::string reason;
        if (!CheckNesting(data, size, reason)) return Fail(error, reason);

        json j;
        try {
            j = json::from_msgpack(data, data + size);
        }
        catch (const json::exception& e) {
            return Fail(error, e.what());
        }

        if (!j.is_object()) return Fail(error, "payload is not a map");
        std::string type;
        if (!ReadString(j, "type", type)) return Fail(error, "payload has no string type");

        size_t kindIdx = kKnownKindCount;
        for (size_t i = 0; i < kKnownKindCount; ++i) {
            if (type == kKindNames[i]) { kindIdx = i; break; }
        }

        switch (static_cast<MessageKind>(kindIdx)) {
        case MessageKind::Handshake: {
            HandshakeMessage m;
            if (!ReadString(j, "clientVersion", m.clientVersion)) return Fail(error, "handshake: bad clientVersion");
            out = std::move(m);
            return true;
        }
        case MessageKind::Handshake_Ack: {
            HandshakeAckMessage m;
            if (!ReadString(j, "connectionId", m.connectionId)
                || !ReadString(j, "serverVersion", m.serverVersion))
                return Fail(error, "handshake_ack: bad fields");
            out = std::move(m);
            return true;
        }
        case MessageKind::Error: {
            ErrorMessage m;
            if (!ReadString(j, "code", m.code) || !ReadString(j, "message", m.message))
                return Fail(error, "error: bad fields");
            out = std::move(m);
            return true;
        }
        case MessageKind::Welcome: {
            WelcomeMessage m;
            if (!ReadU16(j, "numericId", m.numericId) || !ReadString(j, "secret", m.secret))
                return Fail(error, "welcome: bad fields");
            out = std::move(m);
            return true;
        }
        case MessageKind::User_Join: {
            UserJoinMessage m;
            if (!ReadU16(j, "numericId", m.numericId)) return Fail(error, "user_join: bad numericId");
            out = m;
            return true;
        }
        case MessageKind::User_Leave: {
            UserLeaveMessage m;
            if (!ReadU16(j, "numericId", m.numericId)) return Fail(error, "user_leave: bad numericId");
            out = m;
            return true;
        }
        case MessageKind::Channel_Join: {
            ChannelJoinMessage m;
            if (!ReadU16(j, "channelId", m.channelId)) return Fail(error, "channel_join: bad channelId");
            out = m;
            return true;
        }
        case MessageKind::Channel_Leave: {
            ChannelLeaveMessage m;
            if (!ReadU16(j, "channelId", m.channelId)) return Fail(error, "channel_leave: bad channelId");
            out = m;
            return true;
        }
        case MessageKind::Unknown:
            break;
        }

        out = UnknownMessage{ std::move(type), std::move(j) };
        return true;
    }

} // namespace FleetNet
