#include "SessionDirectory.h"
#include <asio.hpp>
#include <mutex>
#include <system_error>

namespace {

    // Canonical text of an IPv4/IPv6 literal, or nothing if it isn't one.
    std::optional<std::string> CanonicalAddress(const std::string& address) {
        if (address.empty()) return std::nullopt;
        std::error_code ec;
        const asio::ip::address parsed = asio::ip::make_address(address, ec);
        if (ec) return std::nullopt;
        return parsed.to_string();
    }

    bool IsValidPort(int port) {
        return port >= 1 && port <= 65535;
    }

    std::string EndpointKey(const std::string& canonicalAddress, uint16_t port) {
        if (canonicalAddress.find(':') != std::string::npos)
            return '[' + canonicalAddress + "]:" + std::to_string(port);
        return canonicalAddress + ':' + std::to_string(port);
    }

} // namespace

namespace FleetNet {

    SessionDirectory::SessionDirectory(uint16_t firstNumericId)
        : m_NextNumericId(firstNumericId == 0 ? kMinNumericId : firstNumericId)
    {
    }

    // ---------------------------------------------------------------------------
    // Mutations (exclusive lock)
    // ---------------------------------------------------------------------------

    Session SessionDirectory::CreateSession(const std::string& connectionId,
        std::optional<std::string> clientVersion)
    {
        // Secret generation may hit the OS entropy source; keep it outside the lock.
        const SessionSecret secret = GenerateSessionSecret();

        std::unique_lock lock(m_Mutex);
        if (m_ByConnectionId.find(connectionId) != m_ByConnectionId.end())
            throw DuplicateConnectionError(connectionId);

        const uint16_t id = AllocateNumericIdLocked();

        Session session;
        session.numericId = id;
        session.connectionId = connectionId;
        session.secret = secret;
        session.connectedAt = Session::Clock::now();
        session.clientVersion = std::move(clientVersion);

        m_ByConnectionId.emplace(connectionId, id);
        return m_Sessions.emplace(id, std::move(session)).first->second;
    }

    bool SessionDirectory::UpdateUdpEndpoint(uint16_t numericId, const std::string& address, int port) {
        if (!IsValidPort(port)) return false;
        const auto canonical = CanonicalAddress(address);
        if (!canonical) return false;
        const uint16_t udpPort = static_cast<uint16_t>(port);
        const std::string newKey = EndpointKey(*canonical, udpPort);

        std::unique_lock lock(m_Mutex);
        auto it = m_Sessions.find(numericId);
        if (it == m_Sessions.end()) return false;
        Session& session = it->second;

        // NAT rebind: drop this session's previous endpoint.
        if (session.udpAddress && session.udpPort) {
            const std::string oldKey = EndpointKey(*session.udpAddress, *session.udpPort);
            if (oldKey != newKey) m_ByUdpEndpoint.erase(oldKey);
        }

        // Another session proved this endpoint earlier; it loses it now.
        auto owner = m_ByUdpEndpoint.find(newKey);
        if (owner != m_ByUdpEndpoint.end() && owner->second != numericId) {
            auto prev = m_Sessions.find(owner->second);
            if (prev != m_Sessions.end()) {
                prev->second.udpAddress.reset();
                prev->second.udpPort.reset();
            }
            m_ByUdpEndpoint.erase(owner);
        }

        session.udpAddress = *canonical;
        session.udpPort = udpPort;
        session.lastUdpActivity = Session::Clock::now();
        m_ByUdpEndpoint[newKey] = numericId;
        return true;
    }

    bool SessionDirectory::RemoveSession(uint16_t numericId) {
        std::unique_lock lock(m_Mutex);
        if (!FindLocked(numericId, nullptr)) return false;
        EraseLocked(numericId);
        return true;
    }

    bool SessionDirectory::RemoveSession(uint16_t numericId, const std::string& connectionId) {
        std::unique_lock lock(m_Mutex);
        if (!FindLocked(numericId, &connectionId)) return false;
        EraseLocked(numericId);
        return true;
    }

    bool SessionDirectory::SubscribeChannel(uint16_t numericId, ChannelId channelId) {
        std::unique_lock lock(m_Mutex);
        Session* session = FindLocked(numericId, nullptr);
        return session && session->subscribedChannels.insert(channelId).second;
    }

    bool SessionDirectory::SubscribeChannel(uint16_t numericId, const std::string& connectionId, ChannelId channelId) {
        std::unique_lock lock(m_Mutex);
        Session* session = FindLocked(numericId, &connectionId);
        return session && session->subscribedChannels.insert(channelId).second;
    }

    bool SessionDirectory::UnsubscribeChannel(uint16_t numericId, ChannelId channelId) {
        std::unique_lock lock(m_Mutex);
        Session* session = FindLocked(numericId, nullptr);
        return session && session->subscribedChannels.erase(channelId) > 0;
    }

    bool SessionDirectory::UnsubscribeChannel(uint16_t numericId, const std::string& connectionId, ChannelId channelId) {
        std::unique_lock lock(m_Mutex);
        Session* session = FindLocked(numericId, &connectionId);
        return session && session->subscribedChannels.erase(channelId) > 0;
    }

    bool SessionDirectory::GrantPermission(uint16_t numericId, const std::string& permission) {
        std::unique_lock lock(m_Mutex);
        Session* session = FindLocked(numericId, nullptr);
        return session && session->permissions.insert(permission).second;
    }

    bool SessionDirectory::RevokePermission(uint16_t numericId, const std::string& permission) {
        std::unique_lock lock(m_Mutex);
        Session* session = FindLocked(numericId, nullptr);
        return session && session->permissions.erase(permission) > 0;
    }

    Session* SessionDirectory::FindLocked(uint16_t numericId, const std::string* connectionId) {
        auto it = m_Sessions.find(numericId);
        if (it == m_Sessions.end()) return nullptr;
        if (connectionId && it->second.connectionId != *connectionId) return nullptr;
        return &it->second;
    }

    void SessionDirectory::EraseLocked(uint16_t numericId) {
        auto it = m_Sessions.find(numericId);
        if (it == m_Sessions.end()) return;
        const Session& session = it->second;
        m_ByConnectionId.erase(session.connectionId);
        if (session.udpAddress && session.udpPort)
            m_ByUdpEndpoint.erase(EndpointKey(*session.udpAddress, *session.udpPort));
        m_Sessions.erase(it);
    }

    // ---------------------------------------------------------------------------
    // Lookups (shared lock)
    // ---------------------------------------------------------------------------

    std::optional<Session> SessionDirectory::LookupByNumericId(uint16_t numericId) const {
        std::shared_lock lock(m_Mutex);
        auto it = m_Sessions.find(numericId);
        if (it == m_Sessions.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Session> SessionDirectory::LookupByConnectionId(const std::string& connectionId) const {
        std::shared_lock lock(m_Mutex);
        auto idIt = m_ByConnectionId.find(connectionId);
        if (idIt == m_ByConnectionId.end()) return std::nullopt;
        auto it = m_Sessions.find(idIt->second);
        if (it == m_Sessions.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Session> SessionDirectory::LookupByUdpEndpoint(const std::string& address, int port) const {
        if (!IsValidPort(port)) return std::nullopt;
        const auto canonical = CanonicalAddress(address);
        if (!canonical) return std::nullopt;
        const std::string key = EndpointKey(*canonical, static_cast<uint16_t>(port));

        std::shared_lock lock(m_Mutex);
        auto idIt = m_ByUdpEndpoint.find(key);
        if (idIt == m_ByUdpEndpoint.end()) return std::nullopt;
        auto it = m_Sessions.find(idIt->second);
        if (it == m_Sessions.end()) return std::nullopt;
        return it->second;
    }

    size_t SessionDirectory::SessionCount() const {
        std::shared_lock lock(m_Mutex);
        return m_Sessions.size();
    }

    WelcomeMessage SessionDirectory::MakeWelcome(const Session& session) {
        return WelcomeMessage{ session.numericId,
            EncodeBase64(session.secret.data(), session.secret.size()) };
    }

    // ---------------------------------------------------------------------------
    // Id allocation. Scans forward from the cursor, wrapping 65535 -> 1.
    // ---------------------------------------------------------------------------

    uint16_t SessionDirectory::AllocateNumericIdLocked() {
        const uint16_t start = m_NextNumericId;
        while (m_Sessions.find(m_NextNumericId) != m_Sessions.end()) {
            AdvanceCursorLocked();
            if (m_NextNumericId == start) throw SessionCapacityError();
        }
        const uint16_t id = m_NextNumericId;
        AdvanceCursorLocked();
        return id;
    }

    void SessionDirectory::AdvanceCursorLocked() {
        m_NextNumericId = (m_NextNumericId == kMaxNumericId)
            ? kMinNumericId
            : static_cast<uint16_t>(m_NextNumericId + 1);
    }

} // namespace FleetNet
