// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/message.hpp"
#include <nlohmann/json.hpp>
#include <set>

using namespace peerlink::message;
using json = nlohmann::json;

namespace {

std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

DecodeError DecodeJson(const json& j, PeerMessage& out) {
    auto bytes = Bytes(j.dump());
    return decode_envelope(bytes.data(), bytes.size(), out);
}

json EnvelopeJson(const PeerMessage& msg) {
    auto bytes = encode_envelope(msg);
    return json::parse(bytes.begin(), bytes.end());
}

} // namespace

TEST_CASE("Message type names", "[message]") {
    SECTION("Every type has a distinct camelCase name that parses back") {
        std::set<std::string> names;
        for (auto type : AllMessageTypes()) {
            std::string name = MessageTypeName(type);
            REQUIRE_FALSE(name.empty());
            REQUIRE(names.insert(name).second);
            REQUIRE(MessageTypeFromName(name) == type);
        }
        REQUIRE(names.size() == 28);
    }

    SECTION("Known spellings") {
        CHECK(std::string(MessageTypeName(MessageType::ConnectionRequest)) == "connectionRequest");
        CHECK(std::string(MessageTypeName(MessageType::IceCandidate)) == "iceCandidate");
        CHECK(std::string(MessageTypeName(MessageType::Ping)) == "ping");
    }

    SECTION("Unknown names") {
        CHECK_FALSE(MessageTypeFromName("ConnectionRequest").has_value());
        CHECK_FALSE(MessageTypeFromName("").has_value());
        CHECK_FALSE(MessageTypeFromName("verack").has_value());
    }
}

TEST_CASE("Envelope encoding", "[message]") {
    SECTION("Fields and base64 payload") {
        PeerMessage msg(MessageType::FileChunk, "device-a", Bytes("abc"));
        json j = EnvelopeJson(msg);
        CHECK(j["version"] == 1);
        CHECK(j["type"] == "fileChunk");
        CHECK(j["senderID"] == "device-a");
        CHECK(j["payload"] == "YWJj");
    }

    SECTION("Payload omitted when absent") {
        json j = EnvelopeJson(make_ping("device-a"));
        CHECK_FALSE(j.contains("payload"));
    }

    SECTION("Decode reproduces the message") {
        PeerMessage original(MessageType::FileChunk, "device-a", std::vector<uint8_t>{0, 1, 2, 255});
        auto bytes = encode_envelope(original);
        PeerMessage decoded;
        REQUIRE(decode_envelope(bytes.data(), bytes.size(), decoded) == DecodeError::None);
        REQUIRE(decoded == original);
        REQUIRE(decoded.payload().size() == 4);
    }

    SECTION("Empty payload survives and differs from no payload") {
        PeerMessage original(MessageType::FileChunk, "a", std::vector<uint8_t>{});
        auto bytes = encode_envelope(original);
        PeerMessage decoded;
        REQUIRE(decode_envelope(bytes.data(), bytes.size(), decoded) == DecodeError::None);
        CHECK(decoded.has_payload());
        CHECK(decoded.payload().empty());
    }
}

TEST_CASE("Envelope decode errors", "[message]") {
    PeerMessage out;

    SECTION("Not JSON") {
        auto bytes = Bytes("{not json");
        CHECK(decode_envelope(bytes.data(), bytes.size(), out) == DecodeError::MalformedEnvelope);
    }

    SECTION("Not an object") {
        CHECK(DecodeJson(json::array({1, 2}), out) == DecodeError::MalformedEnvelope);
    }

    SECTION("Missing fields") {
        CHECK(DecodeJson({{"type", "ping"}, {"senderID", "a"}}, out) == DecodeError::MissingField);
        CHECK(DecodeJson({{"version", 1}, {"senderID", "a"}}, out) == DecodeError::MissingField);
        CHECK(DecodeJson({{"version", 1}, {"type", "ping"}}, out) == DecodeError::MissingField);
    }

    SECTION("Wrong field types") {
        CHECK(DecodeJson({{"version", "1"}, {"type", "ping"}, {"senderID", "a"}}, out) ==
              DecodeError::MalformedEnvelope);
        CHECK(DecodeJson({{"version", 1}, {"type", 7}, {"senderID", "a"}}, out) ==
              DecodeError::MalformedEnvelope);
        CHECK(DecodeJson({{"version", 1}, {"type", "ping"}, {"senderID", "a"}, {"payload", 5}},
                         out) == DecodeError::MalformedEnvelope);
    }

    SECTION("Unknown type") {
        CHECK(DecodeJson({{"version", 1}, {"type", "inv"}, {"senderID", "a"}}, out) ==
              DecodeError::UnknownMessageType);
    }

    SECTION("Bad base64") {
        CHECK(DecodeJson({{"version", 1}, {"type", "fileChunk"}, {"senderID", "a"},
                          {"payload", "abc"}},
                         out) == DecodeError::InvalidBase64);
    }

    SECTION("A failed decode leaves the output untouched") {
        PeerMessage keep = make_ping("keep");
        CHECK(DecodeJson({{"version", 1}, {"type", "inv"}, {"senderID", "a"}}, keep) ==
              DecodeError::UnknownMessageType);
        CHECK(keep.sender_id() == "keep");
    }
}

TEST_CASE("Typed payloads", "[message]") {
    SECTION("Hello carries identity and fingerprint") {
        PeerIdentity id{"id-1", "Laptop", std::string("ab12")};
        auto msg = make_hello(id);
        CHECK(msg.type() == MessageType::Hello);
        CHECK(msg.sender_id() == "id-1");

        PeerIdentity decoded;
        REQUIRE(decode_payload(msg, decoded) == DecodeError::None);
        CHECK(decoded == id);
    }

    SECTION("Rejection reason") {
        RejectionPayload reject;
        REQUIRE(decode_payload(make_connection_reject("a", "busy"), reject) == DecodeError::None);
        CHECK(reject.reason == "busy");
    }

    SECTION("File offer with optional fields") {
        TransferMetadata meta;
        meta.file_name = "photo.jpg";
        meta.file_size = 123456;
        meta.mime_type = "image/jpeg";
        meta.sha256_hash = std::string(64, 'a');
        meta.file_index = 1;
        meta.total_files = 3;

        TransferMetadata decoded;
        REQUIRE(decode_payload(make_file_offer("a", meta), decoded) == DecodeError::None);
        CHECK(decoded == meta);
    }

    SECTION("File offer without isDirectory still decodes") {
        json j = {{"fileName", "a.txt"}, {"fileSize", 3}, {"sha256Hash", "00"}};
        PeerMessage msg(MessageType::FileOffer, "a", Bytes(j.dump()));
        TransferMetadata decoded;
        REQUIRE(decode_payload(msg, decoded) == DecodeError::None);
        CHECK_FALSE(decoded.is_directory);
        CHECK_FALSE(decoded.mime_type.has_value());
    }

    SECTION("Negative file size is malformed") {
        json j = {{"fileName", "a.txt"}, {"fileSize", -1}, {"sha256Hash", "00"}};
        PeerMessage msg(MessageType::FileOffer, "a", Bytes(j.dump()));
        TransferMetadata decoded;
        CHECK(decode_payload(msg, decoded) == DecodeError::MalformedPayload);
    }

    SECTION("Text message with reply context") {
        TextMessagePayload text;
        text.text = "hello there";
        text.timestamp = 1700000000.5;
        text.reply_to_message_id = "m-1";
        text.sender_name = "Phone";

        TextMessagePayload decoded;
        REQUIRE(decode_payload(make_text_message("a", text), decoded) == DecodeError::None);
        CHECK(decoded == text);
    }

    SECTION("Media message thumbnail travels as base64") {
        MediaMessagePayload media;
        media.id = "m-2";
        media.media_type = "image";
        media.file_name = "cat.png";
        media.file_size = 2048;
        media.mime_type = "image/png";
        media.thumbnail_data = std::vector<uint8_t>{1, 2, 3, 4, 5};

        MediaMessagePayload decoded;
        REQUIRE(decode_payload(make_media_message("a", media), decoded) == DecodeError::None);
        CHECK(decoded == media);
    }

    SECTION("Receipt, reaction, typing, ICE") {
        MessageReceiptPayload receipt{{"m-1", "m-2"}, "read", 1.0, std::nullopt, std::nullopt};
        MessageReceiptPayload r;
        REQUIRE(decode_payload(make_message_receipt("a", receipt), r) == DecodeError::None);
        CHECK(r == receipt);

        ReactionPayload reaction{"m-1", "+1", "add", 2.0};
        ReactionPayload re;
        REQUIRE(decode_payload(make_reaction("a", reaction), re) == DecodeError::None);
        CHECK(re == reaction);

        TypingIndicatorPayload typing;
        REQUIRE(decode_payload(make_typing_indicator("a", true), typing) == DecodeError::None);
        CHECK(typing.is_typing);

        IceCandidatePayload ice{std::string("0"), 1, "candidate:1 1 udp 1 10.0.0.2 5000 typ host"};
        IceCandidatePayload ic;
        REQUIRE(decode_payload(make_ice_candidate("a", ice), ic) == DecodeError::None);
        CHECK(ic == ice);
    }

    SECTION("SDP offer and answer") {
        SdpPayload sdp;
        REQUIRE(decode_payload(make_sdp_offer("a", "v=0"), sdp) == DecodeError::None);
        CHECK(sdp.type == "offer");
        REQUIRE(decode_payload(make_sdp_answer("a", "v=0"), sdp) == DecodeError::None);
        CHECK(sdp.type == "answer");
        CHECK(sdp.sdp == "v=0");
    }

    SECTION("Payload problems") {
        PeerIdentity id;
        CHECK(decode_payload(make_ping("a"), id) == DecodeError::MissingPayload);

        PeerMessage not_json(MessageType::Hello, "a", Bytes("xyz"));
        CHECK(decode_payload(not_json, id) == DecodeError::MalformedPayload);

        PeerMessage missing(MessageType::Hello, "a", Bytes(R"({"id":"a"})"));
        CHECK(decode_payload(missing, id) == DecodeError::MissingField);

        PeerMessage wrong(MessageType::Hello, "a", Bytes(R"({"id":1,"displayName":"x"})"));
        CHECK(decode_payload(wrong, id) == DecodeError::MalformedPayload);
    }
}
