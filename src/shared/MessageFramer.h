#pragma once
#include "Messages.h"
#include "Protocol.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace FleetNet {

    // ---------------------------------------------------------------------------
    // Length-prefixed framing for one control connection.
    //
    // Owned by exactly one connection and never shared, so it carries no lock.
    // Incoming bytes accumulate until at least one whole frame is present;
    // partial frames stay buffered across AddData calls.
    // ---------------------------------------------------------------------------
    class MessageFramer {
    public:
        explicit MessageFramer(uint32_t maxFrameSize = kDefaultMaxFrameSize);

        std::vector<uint8_t> Encode(const Message& message) const;

        /// Appends chunk and returns every message completed by it, in stream
        /// order. A frame whose payload fails to decode is consumed and skipped.
        std::vector<Message> AddData(const uint8_t* data, size_t size);
        std::vector<Message> AddData(const std::vector<uint8_t>& chunk) { return AddData(chunk.data(), chunk.size()); }

        void Reset();

        size_t GetBufferedSize() const { return m_Buffer.size(); }
        uint64_t GetDroppedFrameCount() const { return m_DroppedFrames; }
        const std::string& GetLastDecodeError() const { return m_LastDecodeError; }

        // Set once a length header exceeds the frame ceiling. No further
        // frames are produced until Reset().
        bool IsDesynchronized() const { return m_Desynchronized; }

    private:
        std::vector<uint8_t> m_Buffer;
        uint32_t             m_MaxFrameSize;
        uint64_t             m_DroppedFrames{ 0 };
        std::string          m_LastDecodeError;
        bool                 m_Desynchronized{ false };
    };

} // namespace FleetNet
