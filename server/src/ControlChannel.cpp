#include "ControlChannel.h"
#include "Logger.h"
#include <utility>

namespace FleetNet {

    ControlChannel::ControlChannel(std::shared_ptr<SessionDirectory> directory,
        std::string connectionId, std::string serverVersion)
        : m_Directory(std::move(directory))
        , m_ConnectionId(std::move(connectionId))
        , m_ServerVersion(std::move(serverVersion))
    {
    }

    ControlChannel::~ControlChannel() {
        Close();
    }

    std::vector<Message> ControlChannel::HandleMessage(const Message& message) {
        switch (m_State) {
        case ChannelState::Awaiting_Handshake:
            if (const auto* hello = std::get_if<HandshakeMessage>(&message))
                return HandleHandshake(*hello);
            ControlTrace::log("step=handshake_reject reason=unexpected_kind conn=" + m_ConnectionId
                + " kind=" + KindName(KindOf(message)));
            m_CloseRequested = true;
            return { ErrorMessage{ "handshake_required", "first message must be a handshake" } };

        case ChannelState::Established:
            return HandleEstablished(message);

        case ChannelState::Closed:
            break;
        }
        return {};
    }

    std::vector<Message> ControlChannel::HandleHandshake(const HandshakeMessage& hello) {
        Session session;
        try {
            session = m_Directory->CreateSession(m_ConnectionId, hello.clientVersion);
        }
        catch (const SessionCapacityError& e) {
            ControlTrace::log("step=handshake_reject reason=server_full conn=" + m_ConnectionId);
            m_CloseRequested = true;
            return { ErrorMessage{ "server_full", e.what() } };
        }
        catch (const DuplicateConnectionError& e) {
            ControlTrace::log("step=handshake_reject reason=duplicate_connection conn=" + m_ConnectionId);
            m_CloseRequested = true;
            return { ErrorMessage{ "duplicate_connection", e.what() } };
        }

        m_NumericId = session.numericId;
        m_State = ChannelState::Established;
        ControlTrace::log("step=handshake_ok conn=" + m_ConnectionId
            + " id=" + std::to_string(session.numericId)
            + " client=" + ControlTrace::field(hello.clientVersion)
            + " sessions=" + std::to_string(m_Directory->SessionCount()));

        return {
            HandshakeAckMessage{ m_ConnectionId, m_ServerVersion },
            SessionDirectory::MakeWelcome(session)
        };
    }

    std::vector<Message> ControlChannel::HandleEstablished(const Message& message) {
        const uint16_t id = *m_NumericId;

        if (const auto* join = std::get_if<ChannelJoinMessage>(&message)) {
            if (!m_Directory->SubscribeChannel(id, m_ConnectionId, join->channelId) && !OwnsSession())
                return SessionLost();
            ControlTrace::log("step=channel_join id=" + std::to_string(id)
                + " channel=" + std::to_string(join->channelId));
            return { *join };
        }

        if (const auto* leave = std::get_if<ChannelLeaveMessage>(&message)) {
            if (!m_Directory->UnsubscribeChannel(id, m_ConnectionId, leave->channelId) && !OwnsSession())
                return SessionLost();
            ControlTrace::log("step=channel_leave id=" + std::to_string(id)
                + " channel=" + std::to_string(leave->channelId));
            return { *leave };
        }

        if (std::holds_alternative<HandshakeMessage>(message))
            return { ErrorMessage{ "already_established", "handshake already completed" } };

        const auto* unknown = std::get_if<UnknownMessage>(&message);
        ControlTrace::log("step=unsupported_message id=" + std::to_string(id)
            + " kind=" + (unknown ? ControlTrace::field(unknown->type) : std::string(KindName(KindOf(message)))));
        return { ErrorMessage{ "unsupported_message", "message kind is not handled by this server" } };
    }

    // The id may have been removed and handed to another connection since
    // the handshake; only the connection id tells them apart.
    bool ControlChannel::OwnsSession() const {
        const auto session = m_Directory->LookupByConnectionId(m_ConnectionId);
        return session && m_NumericId && session->numericId == *m_NumericId;
    }

    std::vector<Message> ControlChannel::SessionLost() const {
        ControlTrace::log("step=session_lost conn=" + m_ConnectionId);
        return { ErrorMessage{ "session_not_found", "session is no longer registered" } };
    }

    void ControlChannel::Close() {
        if (m_State == ChannelState::Closed) return;
        m_State = ChannelState::Closed;
        if (m_NumericId && m_Directory->RemoveSession(*m_NumericId, m_ConnectionId)) {
            ControlTrace::log("step=session_removed conn=" + m_ConnectionId
                + " id=" + std::to_string(*m_NumericId));
        }
    }

} // namespace FleetNet
