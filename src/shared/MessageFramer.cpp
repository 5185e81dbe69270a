#include "MessageFramer.h"
#include <stdexcept>

namespace FleetNet {

    MessageFramer::MessageFramer(uint32_t maxFrameSize)
        : m_MaxFrameSize(maxFrameSize)
    {
    }

    std::vector<uint8_t> MessageFramer::Encode(const Message& message) const {
        const std::vector<uint8_t> payload = SerializeMessage(message);
        if (payload.size() > m_MaxFrameSize)
            throw std::length_error("message payload exceeds frame size limit");

        std::vector<uint8_t> frame;
        frame.reserve(kFrameHeaderSize + payload.size());
        AppendBE(frame, static_cast<uint32_t>(payload.size()));
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }

    std::vector<Message> MessageFramer::AddData(const uint8_t* data, size_t size) {
        std::vector<Message> messages;
        if (m_Desynchronized) return messages;
        if (size > 0) m_Buffer.insert(m_Buffer.end(), data, data + size);

        size_t offset = 0;
        while (m_Buffer.size() - offset >= kFrameHeaderSize) {
            const uint32_t length = ReadU32BE(m_Buffer.data() + offset);
            if (length > m_MaxFrameSize) {
                m_Desynchronized = true;
                break;
            }
            if (m_Buffer.size() - offset < kFrameHeaderSize + length) break;

            const uint8_t* payload = m_Buffer.data() + offset + kFrameHeaderSize;
            Message message;
            if (DeserializeMessage(payload, length, message, &m_LastDecodeError))
                messages.push_back(std::move(message));
            else
                ++m_DroppedFrames;

            offset += kFrameHeaderSize + length;
        }

        // Compact once per call rather than once per frame.
        if (offset > 0)
            m_Buffer.erase(m_Buffer.begin(), m_Buffer.begin() + static_cast<std::ptrdiff_t>(offset));
        return messages;
    }

    void MessageFramer::Reset() {
        m_Buffer.clear();
        m_Buffer.shrink_to_fit();
        m_Desynchronized = false;
    }

} // namespace FleetNet
