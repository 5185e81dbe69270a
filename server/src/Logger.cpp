#include "Logger.h"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <cstdio>

namespace FleetNet {

    std::ofstream ControlTrace::s_file;
    std::mutex    ControlTrace::s_mutex;
    bool          ControlTrace::s_enabled = false;

    void ControlTrace::init(const std::string& filePath, bool enabled) {
        if (const char* e = std::getenv("FLEETNET_TRACE"))
            enabled = enabled || (e[0] == '1' || e[0] == 'y' || e[0] == 'Y');

        std::lock_guard<std::mutex> lock(s_mutex);
        if (s_file.is_open()) s_file.close();
        s_enabled = enabled;
        if (s_enabled) {
            s_file.open(filePath, std::ios::out | std::ios::app);
            if (!s_file.is_open())
                std::fprintf(stderr, "[FleetNet Server] cannot open trace file %s, tracing disabled\n", filePath.c_str());
        }
    }

    void ControlTrace::log(const std::string& msg) {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (!s_enabled || !s_file.is_open()) return;

        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        struct tm tm_buf {};
        if (localtime_r(&t, &tm_buf) == nullptr) return;

        char timeBuf[32];
        if (std::strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &tm_buf) == 0) return;

        char lineBuf[4096];
        const int n = std::snprintf(lineBuf, sizeof(lineBuf), "%s.%03d [TRACE] %s\n",
            timeBuf, static_cast<int>(ms.count()), msg.c_str());
        if (n <= 0 || static_cast<size_t>(n) >= sizeof(lineBuf)) return;

        s_file.write(lineBuf, static_cast<std::streamsize>(n));
        s_file.flush();
    }

    std::string ControlTrace::field(const std::string& value) {
        std::string out = value.substr(0, kMaxFieldLength);
        for (char& c : out) {
            const unsigned char u = static_cast<unsigned char>(c);
            if (u <= 0x20 || u >= 0x7f || c == '=') c = '?';
        }
        if (value.size() > kMaxFieldLength) out += "...";
        return out;
    }

    void ControlTrace::shutdown() {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (s_file.is_open()) s_file.close();
        s_enabled = false;
    }

} // namespace FleetNet
