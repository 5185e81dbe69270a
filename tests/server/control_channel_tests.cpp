#include "ControlChannel.h"

#include <cstdint>
#include <iostream>
#include <memory>
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

bool IsError(const std::vector<FleetNet::Message>& replies, const std::string& code) {
    if (replies.size() != 1) return false;
    const auto* error = std::get_if<FleetNet::ErrorMessage>(&replies[0]);
    return error != nullptr && error->code == code;
}

}  // namespace

int main() {
    using namespace FleetNet;
    bool passed = true;

    // Anything but a handshake first closes the connection.
    {
        auto directory = std::make_shared<SessionDirectory>();
        ControlChannel channel(directory, "conn-early", "1.0.0");
        const auto replies = channel.HandleMessage(ChannelJoinMessage{ 4 });
        passed &= Expect(IsError(replies, "handshake_required"), "Non-handshake first message is refused.");
        passed &= Expect(channel.ShouldClose(), "Refused opener asks for close.");
        passed &= Expect(!channel.GetNumericId(), "No session id before a handshake.");
        passed &= Expect(directory->SessionCount() == 0, "No session created for a refused opener.");
    }

    // Handshake creates the session and answers with ack then welcome.
    {
        auto directory = std::make_shared<SessionDirectory>();
        ControlChannel channel(directory, "conn-hello", "1.0.0");
        const auto replies = channel.HandleMessage(HandshakeMessage{ "2.3.1" });

        passed &= Expect(replies.size() == 2, "Handshake gets two replies.");
        const auto* ack = replies.size() == 2 ? std::get_if<HandshakeAckMessage>(&replies[0]) : nullptr;
        const auto* welcome = replies.size() == 2 ? std::get_if<WelcomeMessage>(&replies[1]) : nullptr;
        passed &= Expect(ack != nullptr && ack->connectionId == "conn-hello", "Ack echoes the connection id.");
        passed &= Expect(ack != nullptr && ack->serverVersion == "1.0.0", "Ack carries the server version.");
        passed &= Expect(channel.GetState() == ChannelState::Established, "Channel is established.");
        passed &= Expect(!channel.ShouldClose(), "Established channel stays open.");

        const auto session = directory->LookupByConnectionId("conn-hello");
        passed &= Expect(session.has_value(), "Session is registered under the connection id.");
        passed &= Expect(session && session->clientVersion == std::string("2.3.1"), "Client version is recorded.");
        passed &= Expect(session && channel.GetNumericId() == session->numericId, "Channel knows its numeric id.");
        passed &= Expect(welcome != nullptr && session && welcome->numericId == session->numericId,
            "Welcome carries the numeric id.");
        passed &= Expect(welcome != nullptr && session && *welcome == SessionDirectory::MakeWelcome(*session),
            "Welcome carries the session secret.");

        // Channel membership.
        auto join = channel.HandleMessage(ChannelJoinMessage{ 9 });
        passed &= Expect(join.size() == 1 && join[0] == Message{ ChannelJoinMessage{ 9 } }, "Join is confirmed.");
        auto rec = directory->LookupByNumericId(*channel.GetNumericId());
        passed &= Expect(rec && rec->subscribedChannels.count(9) == 1, "Join subscribes the session.");

        join = channel.HandleMessage(ChannelJoinMessage{ 9 });
        passed &= Expect(join.size() == 1 && join[0] == Message{ ChannelJoinMessage{ 9 } }, "Repeated join is still confirmed.");

        const auto leave = channel.HandleMessage(ChannelLeaveMessage{ 9 });
        passed &= Expect(leave.size() == 1 && leave[0] == Message{ ChannelLeaveMessage{ 9 } }, "Leave is confirmed.");
        rec = directory->LookupByNumericId(*channel.GetNumericId());
        passed &= Expect(rec && rec->subscribedChannels.empty(), "Leave unsubscribes the session.");

        passed &= Expect(IsError(channel.HandleMessage(HandshakeMessage{ "2.3.1" }), "already_established"),
            "Second handshake is refused.");
        passed &= Expect(!channel.ShouldClose(), "Second handshake does not close.");
        passed &= Expect(directory->SessionCount() == 1, "Second handshake creates nothing.");

        UnknownMessage unknown;
        unknown.type = "user_state";
        unknown.body = { { "type", "user_state" }, { "muted", true } };
        passed &= Expect(IsError(channel.HandleMessage(unknown), "unsupported_message"), "Unknown kind is answered with an error.");
        passed &= Expect(IsError(channel.HandleMessage(UserJoinMessage{ 3 }), "unsupported_message"),
            "Server-to-client kind from a client is unsupported.");
        passed &= Expect(!channel.ShouldClose(), "Unsupported kinds do not close.");

        const uint16_t id = *channel.GetNumericId();
        channel.Close();
        passed &= Expect(channel.GetState() == ChannelState::Closed, "Close moves to Closed.");
        passed &= Expect(channel.ShouldClose(), "Closed channel reports close.");
        passed &= Expect(!directory->LookupByNumericId(id), "Close removes the session.");
        channel.Close();
        passed &= Expect(channel.HandleMessage(ChannelJoinMessage{ 1 }).empty(), "Closed channel ignores messages.");
    }

    // Leaving scope removes the session too.
    {
        auto directory = std::make_shared<SessionDirectory>();
        {
            ControlChannel channel(directory, "conn-scoped", "1.0.0");
            channel.HandleMessage(HandshakeMessage{ "1.0.0" });
            passed &= Expect(directory->SessionCount() == 1, "Scoped channel registers a session.");
        }
        passed &= Expect(directory->SessionCount() == 0, "Destroyed channel removes its session.");
    }

    // Session removed behind the channel's back.
    {
        auto directory = std::make_shared<SessionDirectory>();
        ControlChannel channel(directory, "conn-orphan", "1.0.0");
        channel.HandleMessage(HandshakeMessage{ "1.0.0" });
        directory->RemoveSession(*channel.GetNumericId());
        passed &= Expect(IsError(channel.HandleMessage(ChannelJoinMessage{ 2 }), "session_not_found"),
            "Join on a removed session reports it.");
    }

    // The channel's id was removed and handed to someone else.
    {
        auto directory = std::make_shared<SessionDirectory>(SessionDirectory::kMaxNumericId);
        ControlChannel channel(directory, "conn-stale", "1.0.0");
        channel.HandleMessage(HandshakeMessage{ "1.0.0" });
        const uint16_t staleId = *channel.GetNumericId();
        directory->RemoveSession(staleId);
        for (std::uint32_t i = 1; i < SessionDirectory::kMaxNumericId; ++i)
            directory->CreateSession("filler-" + std::to_string(i));
        const auto newcomer = directory->CreateSession("conn-newcomer");
        passed &= Expect(newcomer.numericId == staleId, "Freed id is reallocated after the cursor wraps.");

        passed &= Expect(IsError(channel.HandleMessage(ChannelJoinMessage{ 5 }), "session_not_found"),
            "Stale channel cannot join on the newcomer's behalf.");
        passed &= Expect(IsError(channel.HandleMessage(ChannelLeaveMessage{ 5 }), "session_not_found"),
            "Stale channel cannot leave on the newcomer's behalf.");
        auto rec = directory->LookupByNumericId(staleId);
        passed &= Expect(rec && rec->connectionId == "conn-newcomer" && rec->subscribedChannels.empty(),
            "Newcomer's subscriptions are untouched.");

        channel.Close();
        passed &= Expect(directory->LookupByConnectionId("conn-newcomer").has_value(),
            "Closing the stale channel keeps the newcomer's session.");
    }

    // Duplicate connection id.
    {
        auto directory = std::make_shared<SessionDirectory>();
        const auto existing = directory->CreateSession("conn-dup");
        {
            ControlChannel channel(directory, "conn-dup", "1.0.0");
            passed &= Expect(IsError(channel.HandleMessage(HandshakeMessage{ "1.0.0" }), "duplicate_connection"),
                "Duplicate connection id is refused.");
            passed &= Expect(channel.ShouldClose(), "Duplicate connection asks for close.");
        }
        passed &= Expect(directory->LookupByNumericId(existing.numericId).has_value(),
            "Refused duplicate does not remove the original session.");
    }

    // Every numeric id is live.
    {
        auto directory = std::make_shared<SessionDirectory>();
        for (std::uint32_t i = 1; i <= SessionDirectory::kMaxNumericId; ++i)
            directory->CreateSession("filler-" + std::to_string(i));

        ControlChannel channel(directory, "conn-late", "1.0.0");
        passed &= Expect(IsError(channel.HandleMessage(HandshakeMessage{ "1.0.0" }), "server_full"),
            "Full directory refuses the handshake.");
        passed &= Expect(channel.ShouldClose(), "Full directory closes the connection.");
        passed &= Expect(channel.GetState() == ChannelState::Awaiting_Handshake, "Refused channel never establishes.");
        passed &= Expect(directory->SessionCount() == 65535, "Full directory is unchanged.");
    }

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] fleetnet_control_channel_tests\n";
    return 0;
}
