#pragma once

#include "Crypto.h"
#include "Messages.h"
#include "Protocol.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace FleetNet {

    // ---------------------------------------------------------------------------
    // One connected participant. Lookups hand out copies; the canonical record
    // lives inside SessionDirectory.
    // ---------------------------------------------------------------------------
    struct Session {
        using Clock = std::chrono::system_clock;

        uint16_t                          numericId{ 0 };
        std::string                       connectionId;
        SessionSecret                     secret{};

        // Learned from the first datagram; canonical address text.
        std::optional<std::string>        udpAddress;
        std::optional<uint16_t>           udpPort;
        std::optional<Clock::time_point>  lastUdpActivity;

        std::set<std::string>             permissions;
        std::set<ChannelId>               subscribedChannels;

        Clock::time_point                 connectedAt;
        std::optional<std::string>        clientVersion;
    };

    class SessionCapacityError : public std::runtime_error {
    public:
        SessionCapacityError() : std::runtime_error("no free numeric session id") {}
    };

    class DuplicateConnectionError : public std::runtime_error {
    public:
        explicit DuplicateConnectionError(const std::string& connectionId)
            : std::runtime_error("connection id already registered: " + connectionId) {}
    };

    // ---------------------------------------------------------------------------
    // SessionDirectory
    //
    // Sessions are stored once, keyed by numeric id. The connection-id and
    // UDP-endpoint tables map to that key. All three are guarded by one
    // shared_mutex: writers hold it exclusively for the whole mutation, so a
    // reader never sees the tables disagree.
    // ---------------------------------------------------------------------------
    class SessionDirectory {
    public:
        static constexpr uint16_t kMinNumericId = 1;
        static constexpr uint16_t kMaxNumericId = 65535;

        // firstNumericId sets where allocation starts scanning; 0 means 1.
        explicit SessionDirectory(uint16_t firstNumericId = kMinNumericId);

        SessionDirectory(const SessionDirectory&) = delete;
        SessionDirectory& operator=(const SessionDirectory&) = delete;

        // Throws SessionCapacityError when all 65535 ids are live and
        // DuplicateConnectionError when connectionId is already registered.
        Session CreateSession(const std::string& connectionId,
            std::optional<std::string> clientVersion = std::nullopt);

        /// Records (address, port) as the datagram endpoint of numericId.
        /// Rejects invalid IP literals, ports outside [1, 65535] and unknown
        /// ids without touching any state. A previous endpoint of the same
        /// session is dropped; another session holding the same endpoint loses
        /// it (last writer wins).
        bool UpdateUdpEndpoint(uint16_t numericId, const std::string& address, int port);

        bool RemoveSession(uint16_t numericId);

        // Same as the id-only form, but only while numericId still belongs
        // to connectionId. For holders that can outlive their session, where
        // the id may have been handed to someone else since.
        bool RemoveSession(uint16_t numericId, const std::string& connectionId);

        std::optional<Session> LookupByNumericId(uint16_t numericId) const;
        std::optional<Session> LookupByConnectionId(const std::string& connectionId) const;
        std::optional<Session> LookupByUdpEndpoint(const std::string& address, int port) const;

        // Gateway-owned fields. false when the id is unknown or nothing changed.
        bool SubscribeChannel(uint16_t numericId, ChannelId channelId);
        bool UnsubscribeChannel(uint16_t numericId, ChannelId channelId);
        bool GrantPermission(uint16_t numericId, const std::string& permission);
        bool RevokePermission(uint16_t numericId, const std::string& permission);
        bool SubscribeChannel(uint16_t numericId, const std::string& connectionId, ChannelId channelId);
        bool UnsubscribeChannel(uint16_t numericId, const std::string& connectionId, ChannelId channelId);

        size_t SessionCount() const;

        static WelcomeMessage MakeWelcome(const Session& session);

    private:
        // nullptr when numericId is not live, or (if given) belongs to
        // a different connection id.
        Session* FindLocked(uint16_t numericId, const std::string* connectionId);
        void EraseLocked(uint16_t numericId);
        uint16_t AllocateNumericIdLocked();
        void AdvanceCursorLocked();

        mutable std::shared_mutex                      m_Mutex;
        std::unordered_map<uint16_t, Session>          m_Sessions;
        std::unordered_map<std::string, uint16_t>      m_ByConnectionId;
        std::unordered_map<std::string, uint16_t>      m_ByUdpEndpoint;
        uint16_t                                       m_NextNumericId;
    };

} // namespace FleetNet
