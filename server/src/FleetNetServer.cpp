#include "FleetNetServer.h"
#include "ControlSession.h"   // full definition required: FleetNetServer.cpp creates and stops sessions
#include "Logger.h"
#include "VoiceDatagram.h"
#include <cstdio>
#include <vector>

using asio::ip::tcp;
using asio::ip::udp;

namespace FleetNet {

    FleetNetServer::FleetNetServer(asio::io_context& io_context, const ServerConfig& config)
        : m_Config(config)
        , m_Directory(std::make_shared<SessionDirectory>())
        , m_Acceptor(io_context, tcp::endpoint(tcp::v4(), config.controlPort))
        , m_VoiceUdpSocket(io_context, udp::endpoint(udp::v4(), config.voicePort))
        , m_IoContext(io_context)
    {
        DoAccept();
        StartVoiceUdpReceive();
    }

    void FleetNetServer::JoinClient(std::shared_ptr<ControlSession> session) {
        std::lock_guard lock(m_ConnectionsMutex);
        m_Connections.insert(std::move(session));
    }

    void FleetNetServer::LeaveClient(std::shared_ptr<ControlSession> session) {
        std::lock_guard lock(m_ConnectionsMutex);
        m_Connections.erase(session);
    }

    void FleetNetServer::Stop() {
        if (m_Stopping.exchange(true)) return;
        std::error_code ec;
        m_Acceptor.close(ec);
        m_VoiceUdpSocket.close(ec);

        // Shutdown() only posts; LeaveClient runs later on each session's strand.
        std::vector<std::shared_ptr<ControlSession>> live;
        {
            std::lock_guard lock(m_ConnectionsMutex);
            live.assign(m_Connections.begin(), m_Connections.end());
        }
        for (const auto& s : live) s->Shutdown();
    }

    void FleetNetServer::DoAccept() {
        m_Acceptor.async_accept([this](std::error_code ec, tcp::socket socket) {
            if (m_Stopping.load()) return;
            if (!ec) {
                socket.set_option(tcp::no_delay(true), ec);
                auto session = std::make_shared<ControlSession>(std::move(socket), *this, m_Directory);
                ControlTrace::log("step=accept conn=" + session->GetConnectionId());
                session->Start();
            }
            else {
                std::fprintf(stderr, "[FleetNet Server] accept error: %s (%d)\n", ec.message().c_str(), ec.value());
            }
            DoAccept();
            });
    }

    void FleetNetServer::StartVoiceUdpReceive() {
        m_VoiceUdpSocket.async_receive_from(
            asio::buffer(m_UdpRecvBuffer), m_UdpRemote,
            [this](const std::error_code& ec, std::size_t bytes) {
                if (m_Stopping.load() || ec == asio::error::operation_aborted) return;
                if (!ec && bytes > 0)
                    HandleVoiceDatagram(m_UdpRecvBuffer.data(), bytes, m_UdpRemote);
                StartVoiceUdpReceive();
            });
    }

    void FleetNetServer::HandleVoiceDatagram(const uint8_t* data, size_t size, const udp::endpoint& from) {
        const std::string address = from.address().to_string();
        VoicePacketHeader header;
        const DatagramResult result = BindDatagramSource(*m_Directory, data, size, address, from.port(), header);
        switch (result) {
        case DatagramResult::Malformed:
            ControlTrace::log("step=udp_drop reason=malformed size=" + std::to_string(size));
            break;
        case DatagramResult::Reserved_Id:
            ControlTrace::log("step=udp_drop reason=reserved_id");
            break;
        case DatagramResult::Rejected:
            ControlTrace::log("step=udp_drop reason=session_not_found id=" + std::to_string(header.userId));
            break;
        case DatagramResult::Bound:
        case DatagramResult::Rebound:
            ControlTrace::log("step=udp_bind id=" + std::to_string(header.userId)
                + " endpoint=" + address + ':' + std::to_string(from.port())
                + (result == DatagramResult::Rebound ? " rebind=1" : " rebind=0"));
            break;
        case DatagramResult::Refreshed:
            break;
        }
    }

} // namespace FleetNet
