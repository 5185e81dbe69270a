#include "Protocol.h"
#include "VoiceDatagram.h"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

std::vector<std::uint8_t> Datagram(std::uint16_t userId, std::uint16_t audioLength, std::size_t payloadBytes) {
    FleetNet::VoicePacketHeader header;
    header.channelId = 3;
    header.userId = userId;
    header.sequence = 41;
    header.timestamp = 960;
    header.frameDuration = 20;
    header.audioLength = audioLength;
    std::vector<std::uint8_t> out;
    header.WriteTo(out);
    out.resize(out.size() + payloadBytes, 0x5a);
    return out;
}

}  // namespace

int main() {
    using namespace FleetNet;
    bool passed = true;

    {
        std::vector<std::uint8_t> bytes;
        AppendBE(bytes, static_cast<std::uint32_t>(0x01020304u));
        AppendBE(bytes, static_cast<std::uint16_t>(0xa0b0u));
        passed &= Expect(bytes == std::vector<std::uint8_t>({ 0x01, 0x02, 0x03, 0x04, 0xa0, 0xb0 }), "AppendBE writes big-endian.");
        passed &= Expect(ReadU32BE(bytes.data()) == 0x01020304u, "ReadU32BE reads big-endian.");
        passed &= Expect(ReadU16BE(bytes.data() + 4) == 0xa0b0u, "ReadU16BE reads big-endian.");
    }

    // Header layout.
    {
        VoicePacketHeader header;
        header.channelId = 0x0102;
        header.userId = 0x0304;
        header.sequence = 0x0506;
        header.timestamp = 0x0708090a;
        header.signalStrength = 0x0b;
        header.frameDuration = 0x0c;
        header.audioLength = 2;
        header.hmacPrefix = 0x0f10;
        std::vector<std::uint8_t> bytes;
        header.WriteTo(bytes);
        passed &= Expect(bytes.size() == VoicePacketHeader::kSize, "Header is 16 bytes.");
        const std::vector<std::uint8_t> expected = {
            0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
            0x09, 0x0a, 0x0b, 0x0c, 0x00, 0x02, 0x0f, 0x10 };
        passed &= Expect(bytes == expected, "Fields are laid out big-endian in order.");

        bytes.push_back(0xaa);
        bytes.push_back(0xbb);
        VoicePacketHeader parsed;
        passed &= Expect(VoicePacketHeader::Parse(bytes.data(), bytes.size(), parsed), "Written header parses back.");
        passed &= Expect(parsed.channelId == header.channelId && parsed.userId == header.userId
            && parsed.sequence == header.sequence && parsed.timestamp == header.timestamp
            && parsed.signalStrength == header.signalStrength && parsed.frameDuration == header.frameDuration
            && parsed.audioLength == header.audioLength && parsed.hmacPrefix == header.hmacPrefix,
            "Parsed fields match the written ones.");
    }

    {
        VoicePacketHeader parsed;
        const auto whole = Datagram(7, 0, 0);
        passed &= Expect(VoicePacketHeader::Parse(whole.data(), whole.size(), parsed), "Header with no audio parses.");
        passed &= Expect(!VoicePacketHeader::Parse(whole.data(), whole.size() - 1, parsed), "15-byte datagram is too short.");
        passed &= Expect(!VoicePacketHeader::Parse(whole.data(), 0, parsed), "Empty datagram is too short.");

        const auto shortAudio = Datagram(7, 40, 39);
        const auto longAudio = Datagram(7, 40, 41);
        passed &= Expect(!VoicePacketHeader::Parse(shortAudio.data(), shortAudio.size(), parsed), "Missing audio bytes are rejected.");
        passed &= Expect(!VoicePacketHeader::Parse(longAudio.data(), longAudio.size(), parsed), "Trailing bytes are rejected.");
    }

    // Source binding from datagrams.
    {
        SessionDirectory directory;
        const auto s = directory.CreateSession("conn-voice");
        VoicePacketHeader header;

        const auto malformed = Datagram(s.numericId, 40, 10);
        passed &= Expect(BindDatagramSource(directory, malformed.data(), malformed.size(), "10.0.0.1", 5000, header)
            == DatagramResult::Malformed, "Malformed datagram is dropped.");

        const auto reserved = Datagram(0, 4, 4);
        passed &= Expect(BindDatagramSource(directory, reserved.data(), reserved.size(), "10.0.0.1", 5000, header)
            == DatagramResult::Reserved_Id, "Numeric id 0 is dropped.");
        passed &= Expect(!directory.LookupByUdpEndpoint("10.0.0.1", 5000), "Dropped datagrams bind nothing.");

        const auto stranger = Datagram(999, 4, 4);
        passed &= Expect(BindDatagramSource(directory, stranger.data(), stranger.size(), "10.0.0.1", 5000, header)
            == DatagramResult::Rejected, "Unknown numeric id is rejected.");

        const auto voice = Datagram(s.numericId, 4, 4);
        passed &= Expect(BindDatagramSource(directory, voice.data(), voice.size(), "10.0.0.1", 5000, header)
            == DatagramResult::Bound, "First datagram binds the endpoint.");
        passed &= Expect(header.userId == s.numericId, "Parsed header is handed back.");
        const auto bound = directory.LookupByUdpEndpoint("10.0.0.1", 5000);
        passed &= Expect(bound && bound->numericId == s.numericId, "Bound endpoint finds the session.");

        passed &= Expect(BindDatagramSource(directory, voice.data(), voice.size(), "10.0.0.1", 5000, header)
            == DatagramResult::Refreshed, "Same endpoint only refreshes.");
        passed &= Expect(BindDatagramSource(directory, voice.data(), voice.size(), "10.0.0.2", 6000, header)
            == DatagramResult::Rebound, "New source endpoint rebinds.");
        passed &= Expect(!directory.LookupByUdpEndpoint("10.0.0.1", 5000), "Old endpoint is released on rebind.");

        passed &= Expect(BindDatagramSource(directory, voice.data(), voice.size(), "10.0.0.2", 0, header)
            == DatagramResult::Rejected, "Unusable source port is rejected.");
        const auto rec = directory.LookupByNumericId(s.numericId);
        passed &= Expect(rec && rec->udpAddress == std::string("10.0.0.2") && rec->udpPort == 6000,
            "Rejected datagram leaves the endpoint alone.");
    }

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] fleetnet_protocol_tests\n";
    return 0;
}
