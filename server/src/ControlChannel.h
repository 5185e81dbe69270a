#pragma once
#include "Messages.h"
#include "SessionDirectory.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace FleetNet {

    enum class ChannelState : uint8_t {
        Awaiting_Handshake,
        Established,
        Closed
    };

    // ---------------------------------------------------------------------------
    // Per-connection control logic, independent of sockets. The connection
    // feeds it decoded messages and writes back whatever it returns; once
    // ShouldClose() is true the connection flushes the replies and closes.
    // ---------------------------------------------------------------------------
    class ControlChannel {
    public:
        ControlChannel(std::shared_ptr<SessionDirectory> directory,
            std::string connectionId, std::string serverVersion);
        ~ControlChannel();

        ControlChannel(const ControlChannel&) = delete;
        ControlChannel& operator=(const ControlChannel&) = delete;

        std::vector<Message> HandleMessage(const Message& message);

        // Removes the session from the directory, if one was created.
        // Safe to call more than once.
        void Close();

        ChannelState GetState() const { return m_State; }
        bool ShouldClose() const { return m_CloseRequested || m_State == ChannelState::Closed; }
        const std::string& GetConnectionId() const { return m_ConnectionId; }
        std::optional<uint16_t> GetNumericId() const { return m_NumericId; }

    private:
        std::vector<Message> HandleHandshake(const HandshakeMessage& hello);
        std::vector<Message> HandleEstablished(const Message& message);
        bool OwnsSession() const;
        std::vector<Message> SessionLost() const;

        std::shared_ptr<SessionDirectory> m_Directory;
        std::string                       m_ConnectionId;
        std::string                       m_ServerVersion;
        ChannelState                      m_State{ ChannelState::Awaiting_Handshake };
        std::optional<uint16_t>           m_NumericId;
        bool                              m_CloseRequested{ false };
    };

} // namespace FleetNet
