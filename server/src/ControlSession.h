#pragma once
#include <array>
#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "ControlChannel.h"
#include "MessageFramer.h"
#include <asio.hpp>

namespace FleetNet {
    class FleetNetServer;
}

namespace FleetNet {

    // One accepted control connection. Reads and writes run on the session's
    // strand, so the framer and channel are only ever touched by one handler.
    class ControlSession : public std::enable_shared_from_this<ControlSession> {
    public:
        ControlSession(asio::ip::tcp::socket socket, FleetNetServer& server,
            std::shared_ptr<SessionDirectory> directory);

        void Start();
        void Send(const Message& message);
        void Shutdown();

        const std::string& GetConnectionId() const { return m_ConnectionId; }

    private:
        void DoRead();
        void ProcessChunk(std::size_t bytes);
        void DoWrite();
        void Disconnect();

        asio::ip::tcp::socket m_Socket;
        FleetNetServer& m_Server;
        asio::strand<asio::any_io_executor> m_Strand;
        std::string m_ConnectionId;
        MessageFramer m_Framer;
        ControlChannel m_Channel;
        std::array<uint8_t, 8192> m_ReadBuffer{};
        std::deque<std::shared_ptr<std::vector<uint8_t>>> m_WriteQueue;
        uint64_t m_ReportedDrops{ 0 };
        bool m_CloseAfterWrite{ false };
        std::atomic<bool> m_Disconnected{ false };
    };

} // namespace FleetNet
