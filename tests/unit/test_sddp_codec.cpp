#include <gtest/gtest.h>
#include "protocol/codec.h"
#include "protocol/json_records.h"
#include "protocol/sddp_message.h"
#include "common/clock.h"
#include "common/types.h"
#include <string>

using namespace c4::sddp;
using namespace c4::sddp::protocol;

namespace {

SddpMessage makeDeviceNotify() {
    HeaderMap headers;
    headers.set("From", std::string("192.168.1.20:1902"));
    headers.set("Host", std::string("acme-1234"));
    headers.set("Max-Age", std::int64_t{1800});
    headers.set("Type", std::string("acme:thermostat"));
    headers.set("Primary-Proxy", std::string("thermostat"));
    headers.set("Proxies", std::string("thermostat,sensor"));
    headers.set("Manufacturer", std::string("Acme"));
    headers.set("Model", std::string("T-1000"));
    headers.set("Driver", std::string("acme_t1000.c4z"));
    return SddpMessage::makeNotify(std::move(headers));
}

} // namespace

// ===========================================================================
// Statement lines
// ===========================================================================

TEST(SddpStatement, Notify) {
    auto st = parseStatementLine("NOTIFY ALIVE SDDP/1.0");
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->kind, MessageKind::Notify);
    EXPECT_EQ(st->version(), "1.0");
}

TEST(SddpStatement, SearchAcceptsHttpProtocol) {
    auto st = parseStatementLine("SEARCH sddp:all HTTP/1.1");
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->kind, MessageKind::Search);
    EXPECT_EQ(st->protocol, "HTTP");
    EXPECT_EQ(st->search_target, "sddp:all");
    EXPECT_EQ(st->version_minor, 1);
}

TEST(SddpStatement, ResponseKeepsReasonPhrase) {
    auto st = parseStatementLine("SDDP/1.0 404 Not  Found");
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->kind, MessageKind::Response);
    EXPECT_EQ(st->status_code, 404);
    EXPECT_EQ(st->status_text, "Not  Found");
}

TEST(SddpStatement, ResponseToHttpSearch) {
    auto st = parseStatementLine("HTTP/1.1 200 OK");
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->kind, MessageKind::Response);
    EXPECT_EQ(st->protocol, "HTTP");
    EXPECT_EQ(st->status_code, 200);
}

TEST(SddpStatement, RejectsUnknownForms) {
    EXPECT_FALSE(parseStatementLine("").has_value());
    EXPECT_FALSE(parseStatementLine("GET / HTTP/1.1").has_value());
    EXPECT_FALSE(parseStatementLine("NOTIFY BYEBYE SDDP/1.0").has_value());
    EXPECT_FALSE(parseStatementLine("NOTIFY ALIVE SDDP/0.9").has_value());
    EXPECT_FALSE(parseStatementLine("SEARCH * FTP/1.0").has_value());
    EXPECT_FALSE(parseStatementLine("SDDP/1.0 OK").has_value());
}

TEST(SddpStatement, MessageConstructorValidates) {
    EXPECT_THROW(SddpMessage("HELLO"), std::invalid_argument);
}

// ===========================================================================
// Encode
// ===========================================================================

TEST(SddpCodec, EncodeSearch) {
    auto msg = SddpMessage::makeSearch("*", HostAndPort{"10.0.0.5", 5000});
    EXPECT_EQ(encode(msg), "SEARCH * SDDP/1.0\r\nHost: \"10.0.0.5:5000\"\r\n\r\n");
}

TEST(SddpCodec, EncodeKeepsHeaderOrderAndLiteralForms) {
    std::string wire = encode(makeDeviceNotify());
    EXPECT_EQ(wire.rfind("NOTIFY ALIVE SDDP/1.0\r\nFrom: \"192.168.1.20:1902\"\r\n", 0), 0u);
    EXPECT_NE(wire.find("\r\nMax-Age: 1800\r\n"), std::string::npos);
    EXPECT_LT(wire.find("Max-Age"), wire.find("Type"));
    EXPECT_EQ(wire.substr(wire.size() - 4), "\r\n\r\n");
}

TEST(SddpCodec, EncodeEmptyHeaders) {
    EXPECT_EQ(encode(SddpMessage::makeNotify({})), "NOTIFY ALIVE SDDP/1.0\r\n\r\n");
}

// ===========================================================================
// Decode
// ===========================================================================

TEST(SddpCodec, RoundTripDeviceNotify) {
    auto original = makeDeviceNotify();
    auto result = decode(encode(original));
    ASSERT_TRUE(result.ok()) << result.error;

    const auto& msg = *result.message;
    EXPECT_EQ(msg, original);
    EXPECT_EQ(msg.kind(), MessageKind::Notify);
    EXPECT_EQ(msg.maxAge(), 1800);
    EXPECT_EQ(msg.type(), "acme:thermostat");
    ASSERT_TRUE(msg.from().has_value());
    EXPECT_EQ(*msg.from(), (HostAndPort{"192.168.1.20", 1902}));
    auto proxies = msg.proxies();
    ASSERT_TRUE(proxies.has_value());
    ASSERT_EQ(proxies->size(), 2u);
    EXPECT_EQ((*proxies)[1], "sensor");
}

TEST(SddpCodec, RoundTripScalarKinds) {
    HeaderMap headers;
    headers.set("S", std::string("text with \"quotes\""));
    headers.set("I", std::int64_t{-7});
    headers.set("R", 0.25);
    headers.set("B", true);
    headers.set("N", nullptr);
    auto original = SddpMessage::makeResponse(headers);

    auto result = decode(encode(original));
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.message->headers(), headers);
    EXPECT_EQ(result.message->statusCode(), 200);
    EXPECT_TRUE(result.message->isSuccessResponse());
}

TEST(SddpCodec, ReencodeIsByteEquivalent) {
    std::string wire =
        "SDDP/1.0 200 OK\r\n"
        "From: \"10.0.0.9:1902\"\r\n"
        "Max-Age: \"1800\"\r\n"
        "Type: c4:unquoted\r\n"
        "Flag: true\r\n"
        "\r\n";
    auto result = decode(wire);
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(encode(*result.message), wire);
}

TEST(SddpCodec, DecodeAcceptsUnquotedAndQuotedNumbers) {
    auto a = decode("NOTIFY ALIVE SDDP/1.0\r\nMax-Age: 60\r\n\r\n");
    auto b = decode("NOTIFY ALIVE SDDP/1.0\r\nMax-Age: \"60\"\r\n\r\n");
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.message->maxAge(), 60);
    EXPECT_EQ(b.message->maxAge(), 60);
}

TEST(SddpCodec, DecodePreservesNameCase) {
    auto result = decode("NOTIFY ALIVE SDDP/1.0\r\nmAnUfAcTuReR: \"Acme\"\r\n\r\n");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message->headers().begin()->name, "mAnUfAcTuReR");
    EXPECT_EQ(result.message->manufacturer(), "Acme");
}

TEST(SddpCodec, DecodeAcceptsBareLineFeeds) {
    auto result = decode("SEARCH * SDDP/1.0\nHost: \"1.2.3.4:5\"\n\n");
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.message->host(), "1.2.3.4:5");
}

TEST(SddpCodec, DecodeFoldsContinuationLines) {
    auto result = decode("NOTIFY ALIVE SDDP/1.0\r\nModel: \"long\r\n  name\"\r\n\r\n");
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.message->model(), "long name");
}

TEST(SddpCodec, DuplicateHeaderLastValueWins) {
    auto result = decode("NOTIFY ALIVE SDDP/1.0\r\nType: \"a\"\r\nHost: \"h\"\r\ntype: \"b\"\r\n\r\n");
    ASSERT_TRUE(result.ok());
    const auto& headers = result.message->headers();
    EXPECT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers.getString("Type"), "b");
    EXPECT_EQ(headers.begin()->name, "type");
}

TEST(SddpCodec, BodyPreserved) {
    std::string wire = "NOTIFY ALIVE SDDP/1.0\r\nHost: \"h\"\r\n\r\npayload";
    auto result = decode(wire);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message->body(), "payload");
    EXPECT_EQ(encode(*result.message), wire);
}

TEST(SddpCodec, DecodeAttachesReceiveInfo) {
    auto steady = Clock::steadyNow();
    auto wall = Clock::wallNow();
    auto result = decode("NOTIFY ALIVE SDDP/1.0\r\n\r\n", HostAndPort{"10.1.1.1", 1902}, steady, wall);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message->sourceAddress(), (HostAndPort{"10.1.1.1", 1902}));
    EXPECT_EQ(result.message->receivedMonotonicTime(), steady);
    EXPECT_EQ(result.message->receivedWallTime(), wall);
}

// ===========================================================================
// Decode robustness
// ===========================================================================

TEST(SddpCodecRobustness, MissingTerminatingBlankLine) {
    auto result = decode("NOTIFY ALIVE SDDP/1.0\r\nHost: \"h\"\r\n");
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.error.empty());
}

TEST(SddpCodecRobustness, HeaderWithoutColon) {
    EXPECT_FALSE(decode("NOTIFY ALIVE SDDP/1.0\r\nHost \"h\"\r\n\r\n").ok());
}

TEST(SddpCodecRobustness, EmptyOrInvalidHeaderName) {
    EXPECT_FALSE(decode("NOTIFY ALIVE SDDP/1.0\r\n: \"h\"\r\n\r\n").ok());
    EXPECT_FALSE(decode("NOTIFY ALIVE SDDP/1.0\r\nBad Name: 1\r\n\r\n").ok());
}

TEST(SddpCodecRobustness, NoLineTerminator) {
    EXPECT_FALSE(decode("NOTIFY ALIVE SDDP/1.0").ok());
    EXPECT_FALSE(decode("").ok());
}

TEST(SddpCodecRobustness, ContinuationBeforeHeader) {
    EXPECT_FALSE(decode("NOTIFY ALIVE SDDP/1.0\r\n  stray\r\n\r\n").ok());
}

TEST(SddpCodecRobustness, GarbageNeverThrows) {
    const std::string samples[] = {
        std::string("\0\0\0\0", 4),
        "\r\n\r\n",
        "M-SEARCH * HTTP/1.1\r\nHOST: 239.255.255.250:1900\r\n\r\n",
        "SDDP/abc 200 OK\r\n\r\n",
        "NOTIFY ALIVE SDDP/1.0\r\n\xff\xfe: \x80\r\n\r\n",
    };
    for (const auto& s : samples) {
        EXPECT_NO_THROW({
            auto r = decode(s);
            EXPECT_FALSE(r.ok());
        });
    }
}

// ===========================================================================
// Scenario: SEARCH from 10.0.0.5:5000
// ===========================================================================

TEST(SddpCodec, SearchScenarioDatagram) {
    auto result = decode("SEARCH * SDDP/1.0\r\nHost: \"10.0.0.5:5000\"\r\n\r\n");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message->kind(), MessageKind::Search);
    EXPECT_EQ(result.message->searchTarget(), "*");
    EXPECT_EQ(result.message->host(), "10.0.0.5:5000");
}

// ===========================================================================
// with*() copies
// ===========================================================================

TEST(SddpMessageCopies, WithHeaderLeavesOriginalUntouched) {
    auto original = SddpMessage::makeNotify({{"Type", std::string("a")}});
    auto changed = original.withHeader("Type", std::string("b")).withoutHeader("Missing");

    EXPECT_EQ(original.type(), "a");
    EXPECT_EQ(changed.type(), "b");
    EXPECT_NE(original, changed);
}

TEST(SddpMessageCopies, WithStatementReclassifies) {
    auto notify = SddpMessage::makeNotify({{"Type", std::string("a")}});
    auto response = notify.withStatement("SDDP/1.0 200 OK");
    EXPECT_EQ(response.kind(), MessageKind::Response);
    EXPECT_EQ(response.headers(), notify.headers());
}

// ===========================================================================
// JSON records
// ===========================================================================

TEST(SddpJson, ResponseRecord) {
    auto result = decode("SDDP/1.0 200 OK\r\nType: \"Acme:Test\"\r\nMax-Age: 1800\r\n\r\n",
                         HostAndPort{"10.0.0.7", 1902}, Clock::steadyNow(), Clock::wallNow());
    ASSERT_TRUE(result.ok());
    auto j = toJson(*result.message);

    EXPECT_EQ(j["kind"], "RESPONSE");
    EXPECT_EQ(j["status_code"], 200);
    EXPECT_EQ(j["status"], "OK");
    EXPECT_EQ(j["sddp_version"], "1.0");
    EXPECT_EQ(j["src_addr"], "10.0.0.7:1902");
    EXPECT_EQ(j["headers"]["Type"], "Acme:Test");
    EXPECT_EQ(j["headers"]["Max-Age"], 1800);
    EXPECT_TRUE(j.contains("utc_time"));
    EXPECT_FALSE(j.contains("body"));
}
