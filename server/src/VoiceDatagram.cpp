#include "VoiceDatagram.h"

namespace FleetNet {

    DatagramResult BindDatagramSource(SessionDirectory& directory,
        const uint8_t* data, size_t size,
        const std::string& address, int port,
        VoicePacketHeader& header)
    {
        if (!VoicePacketHeader::Parse(data, size, header)) return DatagramResult::Malformed;
        if (header.userId == 0) return DatagramResult::Reserved_Id;

        const auto previous = directory.LookupByNumericId(header.userId);
        if (!directory.UpdateUdpEndpoint(header.userId, address, port)) return DatagramResult::Rejected;
        if (!previous || !previous->udpAddress) return DatagramResult::Bound;

        // Compare stored forms; the caller's address text may not be canonical.
        const auto current = directory.LookupByNumericId(header.userId);
        if (current && current->udpAddress == previous->udpAddress && current->udpPort == previous->udpPort)
            return DatagramResult::Refreshed;
        return DatagramResult::Rebound;
    }

} // namespace FleetNet
