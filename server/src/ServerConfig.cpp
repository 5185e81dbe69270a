#include "ServerConfig.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <cstdint>
#include <string>

using json = nlohmann::json;

namespace {

    bool ReadPort(const json& j, const char* key, uint16_t& out, std::string& error) {
        if (!j.contains(key)) return true;
        const json& v = j[key];
        if (!v.is_number_integer()) {
            error = std::string(key) + " must be an integer";
            return false;
        }
        const int64_t port = v.get<int64_t>();
        if (port < 1 || port > 65535) {
            error = std::string(key) + " must be within [1, 65535]";
            return false;
        }
        out = static_cast<uint16_t>(port);
        return true;
    }

} // namespace

namespace FleetNet {

    bool ServerConfig::LoadFromFile(const std::string& path, std::string& error) {
        std::ifstream file(path);
        if (!file.is_open()) {
            error = "cannot open " + path;
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return LoadFromString(buffer.str(), error);
    }

    bool ServerConfig::LoadFromString(const std::string& text, std::string& error) {
        ServerConfig next = *this;
        try {
            const json j = json::parse(text);
            if (!j.is_object()) {
                error = "config root must be an object";
                return false;
            }
            if (!ReadPort(j, "control_port", next.controlPort, error)) return false;
            if (!ReadPort(j, "voice_port", next.voicePort, error)) return false;

            const int64_t threads = j.value("max_threads", static_cast<int64_t>(next.maxThreads));
            if (threads < 1 || threads > 256) {
                error = "max_threads must be within [1, 256]";
                return false;
            }
            next.maxThreads = static_cast<unsigned>(threads);

            const int64_t frameBytes = j.value("max_frame_bytes", static_cast<int64_t>(next.maxFrameBytes));
            if (frameBytes < kMinFrameBytes || frameBytes > static_cast<int64_t>(UINT32_MAX)) {
                error = "max_frame_bytes must be within [" + std::to_string(kMinFrameBytes) + ", 4294967295]";
                return false;
            }
            next.maxFrameBytes = static_cast<uint32_t>(frameBytes);

            next.traceEnabled = j.value("trace_enabled", next.traceEnabled);
            next.traceFile = j.value("trace_file", next.traceFile);
            next.serverVersion = j.value("server_version", next.serverVersion);
        }
        catch (const json::exception& e) {
            error = e.what();
            return false;
        }
        *this = std::move(next);
        return true;
    }

} // namespace FleetNet
