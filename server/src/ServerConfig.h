#pragma once
#include "Protocol.h"
#include "Version.h"
#include <cstdint>
#include <string>

namespace FleetNet {

    struct ServerConfig {
        // Every reply the server sends fits well inside this.
        static constexpr uint32_t kMinFrameBytes = 4096;

        uint16_t    controlPort = CONTROL_PORT;
        uint16_t    voicePort = VOICE_PORT;
        unsigned    maxThreads = 16;
        uint32_t    maxFrameBytes = kDefaultMaxFrameSize;
        bool        traceEnabled = false;
        std::string traceFile = "control_trace.log";
        std::string serverVersion = FLEETNET_VERSION_STRING;

        /// Reads a JSON object; absent keys keep their defaults. Returns false
        /// with a reason in error on unreadable files, bad JSON, or out-of-range
        /// values, leaving *this untouched.
        bool LoadFromFile(const std::string& path, std::string& error);
        bool LoadFromString(const std::string& text, std::string& error);
    };

} // namespace FleetNet
