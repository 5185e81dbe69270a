#include "ControlSession.h"
#include "FleetNetServer.h"
#include "Crypto.h"
#include "Logger.h"
#include <cstdio>
#include <stdexcept>

using asio::ip::tcp;

namespace FleetNet {

    ControlSession::ControlSession(tcp::socket socket, FleetNetServer& server,
        std::shared_ptr<SessionDirectory> directory)
        : m_Socket(std::move(socket))
        , m_Server(server)
        , m_Strand(asio::make_strand(m_Socket.get_executor()))
        , m_ConnectionId(GenerateConnectionId())
        , m_Framer(server.GetConfig().maxFrameBytes)
        , m_Channel(std::move(directory), m_ConnectionId, server.GetConfig().serverVersion)
    {
    }

    void ControlSession::Start() {
        m_Server.JoinClient(shared_from_this());
        asio::dispatch(m_Strand, [this, self = shared_from_this()]() { DoRead(); });
    }

    void ControlSession::Shutdown() {
        asio::post(m_Strand, [this, self = shared_from_this()]() { Disconnect(); });
    }

    void ControlSession::Disconnect() {
        if (m_Disconnected.exchange(true)) return;
        m_Channel.Close();
        m_Server.LeaveClient(shared_from_this());
        std::error_code ec;
        m_Socket.shutdown(tcp::socket::shutdown_both, ec);
        m_Socket.close(ec);
    }

    void ControlSession::DoRead() {
        m_Socket.async_read_some(asio::buffer(m_ReadBuffer),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t bytes) {
                if (!ec) {
                    ProcessChunk(bytes);
                    if (!m_CloseAfterWrite && !m_Disconnected.load()) DoRead();
                }
                else {
                    if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                        std::fprintf(stderr, "[FleetNet Server] read error: %s (%d), disconnecting\n", ec.message().c_str(), ec.value());
                    Disconnect();
                }
                }));
    }

    void ControlSession::ProcessChunk(std::size_t bytes) {
        const std::vector<Message> messages = m_Framer.AddData(m_ReadBuffer.data(), bytes);

        if (m_Framer.GetDroppedFrameCount() != m_ReportedDrops) {
            m_ReportedDrops = m_Framer.GetDroppedFrameCount();
            ControlTrace::log("step=frame_drop reason=decode_fail conn=" + m_ConnectionId
                + " dropped=" + std::to_string(m_ReportedDrops)
                + " error=" + m_Framer.GetLastDecodeError());
        }

        for (const auto& message : messages) {
            for (const auto& reply : m_Channel.HandleMessage(message))
                Send(reply);
            if (m_Channel.ShouldClose()) {
                m_CloseAfterWrite = true;
                break;
            }
        }

        if (!m_CloseAfterWrite && m_Framer.IsDesynchronized()) {
            ControlTrace::log("step=frame_drop reason=oversized conn=" + m_ConnectionId);
            Send(ErrorMessage{ "frame_too_large", "frame length exceeds server limit" });
            m_CloseAfterWrite = true;
        }

        if (m_CloseAfterWrite && m_WriteQueue.empty()) Disconnect();
    }

    void ControlSession::Send(const Message& message) {
        std::shared_ptr<std::vector<uint8_t>> buffer;
        try {
            buffer = std::make_shared<std::vector<uint8_t>>(m_Framer.Encode(message));
        }
        catch (const std::length_error& e) {
            std::fprintf(stderr, "[FleetNet Server] cannot frame %s for %s: %s, disconnecting\n",
                KindName(KindOf(message)), m_ConnectionId.c_str(), e.what());
            asio::dispatch(m_Strand, [this, self = shared_from_this()]() { Disconnect(); });
            return;
        }
        asio::dispatch(m_Strand, [this, self = shared_from_this(), buffer]() {
            if (m_Disconnected.load()) return;
            bool writeInProgress = !m_WriteQueue.empty();
            // Control traffic is small; anything this far behind is a stuck peer.
            if (m_WriteQueue.size() > 200) {
                Disconnect();
                return;
            }
            m_WriteQueue.push_back(buffer);
            if (!writeInProgress) DoWrite();
        });
    }

    void ControlSession::DoWrite() {
        if (m_WriteQueue.empty()) {
            if (m_CloseAfterWrite) Disconnect();
            return;
        }

        asio::async_write(m_Socket, asio::buffer(*m_WriteQueue.front()),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t) {
                if (!ec) {
                    m_WriteQueue.pop_front();
                    DoWrite();
                }
                else {
                    Disconnect();
                }
                }));
    }

} // namespace FleetNet
