#pragma once
#include "Protocol.h"
#include "SessionDirectory.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace FleetNet {

    enum class DatagramResult : uint8_t {
        Bound,          // first endpoint learned for the session
        Rebound,        // session moved to a new endpoint
        Refreshed,      // same endpoint, activity stamped
        Malformed,
        Reserved_Id,    // numeric id 0
        Rejected        // unknown session or unusable source endpoint
    };

    // ---------------------------------------------------------------------------
    // A voice datagram proves its sender's current endpoint. Parses the header
    // and records (address, port) for the numeric id it carries. The HMAC
    // prefix is not checked here.
    // ---------------------------------------------------------------------------
    DatagramResult BindDatagramSource(SessionDirectory& directory,
        const uint8_t* data, size_t size,
        const std::string& address, int port,
        VoicePacketHeader& header);

} // namespace FleetNet
