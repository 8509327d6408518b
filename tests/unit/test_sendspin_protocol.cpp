#include <gtest/gtest.h>
#include "protocol/sendspin_protocol.h"
#include "../mocks/mock_session.h"

using namespace sendspin::audio;
using namespace sendspin::audio::protocol;
using sendspin::audio::testing::MockTransport;

namespace {

Json::Value parse_payload(const std::string& text) {
    auto envelope = parse_envelope(text);
    EXPECT_TRUE(envelope.has_value());
    return envelope ? envelope->payload : Json::Value();
}

} // namespace

TEST(SendspinProtocolTest, ClientHelloDeclaresPlayerRoleAndFormats) {
    ClientHello hello;
    hello.client_id = "3f1c2a9e-0000-4000-8000-000000000001";
    hello.name = "Kitchen";
    hello.device_info.product_name = "Linux x86_64";
    hello.supported_formats = default_supported_formats();
    hello.buffer_capacity = 4 * 1024 * 1024;

    const std::string text = make_client_hello(hello);
    Json::Value root = MockTransport::parse(text);
    EXPECT_EQ(root["type"].asString(), "client/hello");

    const Json::Value& payload = root["payload"];
    EXPECT_EQ(payload["client_id"].asString(), hello.client_id);
    EXPECT_EQ(payload["name"].asString(), "Kitchen");
    EXPECT_EQ(payload["version"].asInt(), 1);
    ASSERT_EQ(payload["supported_roles"].size(), 1u);
    EXPECT_EQ(payload["supported_roles"][0].asString(), "player@v1");
    EXPECT_EQ(payload["device_info"]["product_name"].asString(), "Linux x86_64");

    const Json::Value& support = payload["player_support"];
    EXPECT_EQ(support["buffer_capacity"].asUInt64(), 4u * 1024 * 1024);
    ASSERT_EQ(support["supported_formats"].size(), 2u);
    EXPECT_EQ(support["supported_formats"][0]["codec"].asString(), "pcm");
    EXPECT_EQ(support["supported_formats"][0]["sample_rate"].asInt(), 48000);
    EXPECT_EQ(support["supported_formats"][1]["sample_rate"].asInt(), 44100);
    EXPECT_EQ(support["supported_formats"][1]["channels"].asInt(), 2);
    EXPECT_EQ(support["supported_formats"][1]["bit_depth"].asInt(), 16);
    ASSERT_EQ(support["supported_commands"].size(), 2u);
    EXPECT_EQ(support["supported_commands"][0].asString(), "volume");
    EXPECT_EQ(support["supported_commands"][1].asString(), "mute");
}

TEST(SendspinProtocolTest, ClientTimeCarriesTransmitTimestamp) {
    Json::Value payload = parse_payload(make_client_time(1234567890123LL));
    EXPECT_EQ(payload["client_transmitted"].asInt64(), 1234567890123LL);
}

TEST(SendspinProtocolTest, ClientStateClampsVolume) {
    Json::Value payload = parse_payload(make_client_state(ReportedPlayerState::SYNCHRONIZED, 150, true));
    EXPECT_EQ(payload["player"]["state"].asString(), "synchronized");
    EXPECT_EQ(payload["player"]["volume"].asInt(), 100);
    EXPECT_TRUE(payload["player"]["muted"].asBool());

    payload = parse_payload(make_client_state(ReportedPlayerState::ERROR, -5, false));
    EXPECT_EQ(payload["player"]["state"].asString(), "error");
    EXPECT_EQ(payload["player"]["volume"].asInt(), 0);
}

TEST(SendspinProtocolTest, EnvelopeRejectsMalformedText) {
    EXPECT_FALSE(parse_envelope("not json").has_value());
    EXPECT_FALSE(parse_envelope("[1,2,3]").has_value());
    EXPECT_FALSE(parse_envelope("{\"payload\":{}}").has_value());
    EXPECT_FALSE(parse_envelope("{\"type\":5}").has_value());

    auto envelope = parse_envelope("{\"type\":\"stream/end\"}");
    ASSERT_TRUE(envelope.has_value());
    EXPECT_EQ(envelope->type, "stream/end");
    EXPECT_TRUE(envelope->payload.isNull());
}

TEST(SendspinProtocolTest, ServerHelloRequiresIdAndName) {
    auto envelope = parse_envelope(
        R"({"type":"server/hello","payload":{"server_id":"srv-1","name":"Music Assistant","version":1,)"
        R"("active_roles":["player@v1"],"connection_reason":"discovery"}})");
    ASSERT_TRUE(envelope.has_value());
    auto hello = parse_server_hello(envelope->payload);
    ASSERT_TRUE(hello.has_value());
    EXPECT_EQ(hello->server_id, "srv-1");
    EXPECT_EQ(hello->name, "Music Assistant");
    EXPECT_EQ(hello->version, 1);
    ASSERT_EQ(hello->active_roles.size(), 1u);
    EXPECT_EQ(hello->connection_reason, "discovery");

    Json::Value missing_name(Json::objectValue);
    missing_name["server_id"] = "srv-1";
    EXPECT_FALSE(parse_server_hello(missing_name).has_value());
}

TEST(SendspinProtocolTest, ServerTimeRequiresAllTimestamps) {
    Json::Value payload(Json::objectValue);
    payload["client_transmitted"] = static_cast<Json::Int64>(1000);
    payload["server_received"] = static_cast<Json::Int64>(5000);
    EXPECT_FALSE(parse_server_time(payload).has_value());

    payload["server_transmitted"] = static_cast<Json::Int64>(5010);
    auto time = parse_server_time(payload);
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(time->client_transmitted, 1000);
    EXPECT_EQ(time->server_received, 5000);
    EXPECT_EQ(time->server_transmitted, 5010);

    payload["server_received"] = "5000";
    EXPECT_FALSE(parse_server_time(payload).has_value());
}

TEST(SendspinProtocolTest, StreamStartDecodesPlayerFormatAndHeader) {
    auto envelope = parse_envelope(
        R"({"type":"stream/start","payload":{"player":{"codec":"pcm","sample_rate":48000,)"
        R"("channels":2,"bit_depth":16,"codec_header":"AQID"}}})");
    ASSERT_TRUE(envelope.has_value());
    auto config = parse_stream_start(envelope->payload);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->codec, "pcm");
    EXPECT_EQ(config->sample_rate, 48000);
    EXPECT_EQ(config->channels, 2);
    EXPECT_EQ(config->bit_depth, 16);
    EXPECT_EQ(config->codec_header, (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(config->bytes_per_frame(), 4);
}

TEST(SendspinProtocolTest, StreamStartWithoutPlayerObjectIsRejected) {
    Json::Value payload(Json::objectValue);
    payload["codec"] = "pcm";
    EXPECT_FALSE(parse_stream_start(payload).has_value());
    EXPECT_FALSE(parse_stream_start(Json::Value()).has_value());
}

TEST(SendspinProtocolTest, ServerCommandCarriesOptionalValues) {
    auto envelope = parse_envelope(R"({"type":"server/command","payload":{"player":{"command":"volume","volume":35}}})");
    ASSERT_TRUE(envelope.has_value());
    auto command = parse_server_command(envelope->payload);
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->command, "volume");
    ASSERT_TRUE(command->volume.has_value());
    EXPECT_EQ(*command->volume, 35);
    EXPECT_FALSE(command->mute.has_value());

    envelope = parse_envelope(R"({"type":"server/command","payload":{"player":{"command":"mute","mute":true}}})");
    command = parse_server_command(envelope->payload);
    ASSERT_TRUE(command.has_value());
    ASSERT_TRUE(command->mute.has_value());
    EXPECT_TRUE(*command->mute);
}

TEST(SendspinProtocolTest, StreamRolesDistinguishMissingFromEmpty) {
    EXPECT_FALSE(parse_stream_roles(Json::Value()).has_value());

    auto envelope = parse_envelope(R"({"type":"stream/clear","payload":{"roles":["visualizer","player"]}})");
    auto roles = parse_stream_roles(envelope->payload);
    ASSERT_TRUE(roles.has_value());
    EXPECT_TRUE(roles_include_player(*roles));

    envelope = parse_envelope(R"({"type":"stream/clear","payload":{"roles":["metadata"]}})");
    roles = parse_stream_roles(envelope->payload);
    ASSERT_TRUE(roles.has_value());
    EXPECT_FALSE(roles_include_player(*roles));
}

TEST(SendspinProtocolTest, BinaryFrameDecodesBigEndianTimestamp) {
    const uint8_t frame[] = {4, 0x00, 0x00, 0x00, 0x00, 0x00, 0x0F, 0x42, 0x40, 0xAA, 0xBB, 0xCC, 0xDD};
    auto chunk = parse_binary_frame(frame, sizeof(frame));
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->timestamp_us, 1000000);
    EXPECT_EQ(chunk->payload, (std::vector<uint8_t>{0xAA, 0xBB, 0xCC, 0xDD}));
}

TEST(SendspinProtocolTest, HeaderOnlyBinaryFrameHasEmptyPayload) {
    auto frame = make_binary_audio_frame(42, {});
    auto chunk = parse_binary_frame(frame.data(), frame.size());
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->timestamp_us, 42);
    EXPECT_TRUE(chunk->payload.empty());
}

TEST(SendspinProtocolTest, ShortOrForeignBinaryFramesDecodeToNothing) {
    const uint8_t short_frame[] = {4, 0, 0, 0, 0, 0, 0, 1};
    EXPECT_FALSE(parse_binary_frame(short_frame, sizeof(short_frame)).has_value());
    EXPECT_FALSE(parse_binary_frame(nullptr, 0).has_value());

    auto artwork = make_binary_audio_frame(1000, {1, 2, 3, 4});
    artwork[0] = binary_type::kArtworkFirst;
    EXPECT_FALSE(parse_binary_frame(artwork.data(), artwork.size()).has_value());

    artwork[0] = binary_type::kVisualizer;
    EXPECT_FALSE(parse_binary_frame(artwork.data(), artwork.size()).has_value());
}

TEST(SendspinProtocolTest, Base64DecodingHandlesPaddingAndWhitespace) {
    auto decoded = decode_base64("aGVsbG8=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "hello");

    decoded = decode_base64("aGVs\nbG8h");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "hello!");

    decoded = decode_base64("aGk=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "hi");

    decoded = decode_base64("aA==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "h");

    EXPECT_FALSE(decode_base64("abc").has_value());
    EXPECT_FALSE(decode_base64("ab!@").has_value());
}

TEST(SendspinProtocolTest, SupportedFormatMatchesExactTuple) {
    const auto formats = default_supported_formats();
    StreamConfig config{"pcm", 44100, 2, 16, {}};
    EXPECT_TRUE(is_supported_format(config, formats));

    config.bit_depth = 24;
    EXPECT_FALSE(is_supported_format(config, formats));

    config = StreamConfig{"opus", 48000, 2, 16, {}};
    EXPECT_FALSE(is_supported_format(config, formats));
}

TEST(SendspinProtocolTest, RequestFormatNamesPreferredFormat) {
    Json::Value root = MockTransport::parse(make_stream_request_format(default_supported_formats().front()));
    EXPECT_EQ(root["type"].asString(), "stream/request-format");
    EXPECT_EQ(root["payload"]["player"]["codec"].asString(), "pcm");
    EXPECT_EQ(root["payload"]["player"]["sample_rate"].asInt(), 48000);
}
