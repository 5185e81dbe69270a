#pragma once
#include <cstddef>
#include <string>
#include <fstream>
#include <mutex>

namespace FleetNet {

    // Control-plane trace log. Messages are "step=<name> key=value ..." lines.
    // Off unless enabled by config or FLEETNET_TRACE=1.
    struct ControlTrace {
        static void init(const std::string& filePath, bool enabled);
        static void log(const std::string& msg);
        static void shutdown();

        // Makes peer-supplied text safe as a single value: bytes outside
        // printable ASCII, spaces and '=' become '?', and it is cut to kMaxFieldLength.
        static std::string field(const std::string& value);
        static constexpr size_t kMaxFieldLength = 64;

    private:
        static std::ofstream s_file;
        static std::mutex s_mutex;
        static bool s_enabled;
    };

} // namespace FleetNet
