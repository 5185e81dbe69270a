#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace FleetNet {

    // ---------------------------------------------------------------------------
    // Byte order helpers. Everything FleetNet puts on the wire is big-endian.
    // ---------------------------------------------------------------------------
    namespace detail {
        inline bool IsLittleEndian() noexcept {
            static constexpr uint32_t kOne = 1u;
            uint8_t b;
            std::memcpy(&b, &kOne, 1);
            return b == 1u;
        }
    }

    inline uint32_t Swap32(uint32_t v) noexcept {
        return ((v & 0xFFU) << 24) | ((v & 0xFF00U) << 8)
            | ((v & 0xFF0000U) >> 8) | ((v & 0xFF000000U) >> 24);
    }

    inline uint32_t HostToNet32(uint32_t v) noexcept {
        return detail::IsLittleEndian() ? Swap32(v) : v;
    }

    inline void AppendBE(std::vector<uint8_t>& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }

    inline void AppendBE(std::vector<uint8_t>& out, uint32_t value) {
        uint32_t net = HostToNet32(value);
        uint8_t  tmp[4];
        std::memcpy(tmp, &net, 4);
        for (uint8_t b : tmp) out.push_back(b);
    }

    // The shift loops produce the host-order result directly.
    inline uint16_t ReadU16BE(const uint8_t* p) noexcept {
        return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
    }

    inline uint32_t ReadU32BE(const uint8_t* p) noexcept {
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v = (v << 8) | static_cast<uint32_t>(p[i]);
        return v;
    }

    constexpr uint16_t CONTROL_PORT = 5555;
    constexpr uint16_t VOICE_PORT = 5556;

    // Control channel framing: [u32 length BE][payload].
    constexpr size_t   kFrameHeaderSize = 4;
    constexpr uint32_t kDefaultMaxFrameSize = 10 * 1024 * 1024;

    using ChannelId = uint16_t;

    // ---------------------------------------------------------------------------
    // Voice datagram header. 16 bytes, big-endian, followed by exactly
    // audioLength bytes of Opus payload.
    // ---------------------------------------------------------------------------
    struct VoicePacketHeader {
        static constexpr size_t kSize = 16;

        ChannelId channelId{ 0 };
        uint16_t  userId{ 0 };
        uint16_t  sequence{ 0 };
        uint32_t  timestamp{ 0 };
        uint8_t   signalStrength{ 0 };
        uint8_t   frameDuration{ 0 };
        uint16_t  audioLength{ 0 };
        uint16_t  hmacPrefix{ 0 };

        void WriteTo(std::vector<uint8_t>& out) const {
            AppendBE(out, channelId);
            AppendBE(out, userId);
            AppendBE(out, sequence);
            AppendBE(out, timestamp);
            out.push_back(signalStrength);
            out.push_back(frameDuration);
            AppendBE(out, audioLength);
            AppendBE(out, hmacPrefix);
        }

        // Fails if the datagram is shorter than the header or the payload
        // length disagrees with audioLength.
        static bool Parse(const uint8_t* data, size_t size, VoicePacketHeader& out) {
            if (size < kSize) return false;
            out.channelId = ReadU16BE(data);
            out.userId = ReadU16BE(data + 2);
            out.sequence = ReadU16BE(data + 4);
            out.timestamp = ReadU32BE(data + 6);
            out.signalStrength = data[10];
            out.frameDuration = data[11];
            out.audioLength = ReadU16BE(data + 12);
            out.hmacPrefix = ReadU16BE(data + 14);
            return size - kSize == out.audioLength;
        }
    };

} // namespace FleetNet
