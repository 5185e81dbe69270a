#include "Crypto.h"
#include <random>
#include <cstdio>

namespace {

    constexpr char kBase64Alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    int Base64CharValue(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }

    // std::random_device is the OS entropy source on Linux (getrandom /
    // /dev/urandom). Secrets are drawn from it directly, never from a
    // seeded engine.
    template <size_t N>
    void FillRandom(std::array<uint8_t, N>& out) {
        std::random_device rd;
        for (size_t i = 0; i < N; i += 4) {
            const uint32_t word = rd();
            for (size_t b = 0; b < 4 && i + b < N; ++b)
                out[i + b] = static_cast<uint8_t>(word >> (8 * b));
        }
    }

} // namespace

namespace FleetNet {

    SessionSecret GenerateSessionSecret() {
        SessionSecret secret{};
        FillRandom(secret);
        return secret;
    }

    std::string GenerateConnectionId() {
        std::array<uint8_t, 16> raw{};
        FillRandom(raw);
        std::string id;
        id.reserve(raw.size() * 2);
        char hex[3];
        for (uint8_t b : raw) {
            std::snprintf(hex, sizeof(hex), "%02x", b);
            id += hex;
        }
        return id;
    }

    std::string EncodeBase64(const uint8_t* data, size_t size) {
        std::string out;
        out.reserve(((size + 2) / 3) * 4);

        size_t i = 0;
        for (; i + 3 <= size; i += 3) {
            const uint32_t chunk = (uint32_t)data[i] << 16 | (uint32_t)data[i + 1] << 8 | data[i + 2];
            out += kBase64Alphabet[(chunk >> 18) & 0x3F];
            out += kBase64Alphabet[(chunk >> 12) & 0x3F];
            out += kBase64Alphabet[(chunk >> 6) & 0x3F];
            out += kBase64Alphabet[chunk & 0x3F];
        }

        const size_t remaining = size - i;
        if (remaining == 1) {
            const uint32_t chunk = (uint32_t)data[i] << 16;
            out += kBase64Alphabet[(chunk >> 18) & 0x3F];
            out += kBase64Alphabet[(chunk >> 12) & 0x3F];
            out += "==";
        }
        else if (remaining == 2) {
            const uint32_t chunk = (uint32_t)data[i] << 16 | (uint32_t)data[i + 1] << 8;
            out += kBase64Alphabet[(chunk >> 18) & 0x3F];
            out += kBase64Alphabet[(chunk >> 12) & 0x3F];
            out += kBase64Alphabet[(chunk >> 6) & 0x3F];
            out += '=';
        }
        return out;
    }

    bool DecodeBase64(const std::string& text, std::vector<uint8_t>& out) {
        out.clear();
        if (text.size() % 4 != 0) return false;

        int      bits = 0;
        uint32_t buffer = 0;
        size_t   padding = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (c == '=') {
                // Padding only in the last two positions.
                if (i + 2 < text.size()) return false;
                ++padding;
                continue;
            }
            if (padding > 0) return false;
            const int v = Base64CharValue(c);
            if (v < 0) return false;
            buffer = (buffer << 6) | static_cast<uint32_t>(v);
            bits += 6;
            if (bits >= 8) {
                out.push_back(static_cast<uint8_t>(buffer >> (bits - 8)));
                buffer &= (1u << (bits - 8)) - 1u;
                bits -= 8;
            }
        }
        // Bits left over beside the padding must be zero (RFC 4648 3.5).
        return buffer == 0;
    }

} // namespace FleetNet
