#pragma once

#include "ServerConfig.h"
#include "SessionDirectory.h"
#include <asio.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>

namespace FleetNet {

    class ControlSession;

    // ---------------------------------------------------------------------------
    // FleetNetServer
    //
    // Owns the listening sockets and the process's SessionDirectory. Every
    // ControlSession and the voice datagram path get the directory through a
    // shared_ptr; nothing reaches it through global state.
    // ---------------------------------------------------------------------------
    class FleetNetServer {
    public:
        FleetNetServer(asio::io_context& io_context, const ServerConfig& config);

        // Called by ControlSession on start / disconnect.
        void JoinClient(std::shared_ptr<ControlSession> session);
        void LeaveClient(std::shared_ptr<ControlSession> session);

        // Stops accepting and closes every live connection.
        void Stop();

        const ServerConfig& GetConfig() const { return m_Config; }

    private:
        void DoAccept();
        void StartVoiceUdpReceive();
        void HandleVoiceDatagram(const uint8_t* data, size_t size, const asio::ip::udp::endpoint& from);

        static constexpr size_t kMaxDatagramSize = 2048;

        const ServerConfig m_Config;
        std::shared_ptr<SessionDirectory> m_Directory;

        // --- ASIO handles -------------------------------------------------------
        asio::ip::tcp::acceptor   m_Acceptor;
        asio::ip::udp::socket     m_VoiceUdpSocket;
        asio::io_context&         m_IoContext;
        std::array<uint8_t, kMaxDatagramSize> m_UdpRecvBuffer{};
        asio::ip::udp::endpoint   m_UdpRemote;

        // --- Live connections (guarded by m_ConnectionsMutex) -------------------
        std::mutex                                  m_ConnectionsMutex;
        std::set<std::shared_ptr<ControlSession>>   m_Connections;

        std::atomic<bool> m_Stopping{ false };
    };

} // namespace FleetNet
