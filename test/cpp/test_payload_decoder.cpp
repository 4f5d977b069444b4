#include <catch2/catch_test_macros.hpp>
#include "payload_decoder.hpp"

using namespace arbundle;

TEST_CASE("PayloadDecoder: encodings", "[payload_decoder]") {
    REQUIRE(PayloadDecoder::parseEncoding("base64") == ContentEncoding::Base64);
    REQUIRE(PayloadDecoder::parseEncoding("json") == ContentEncoding::Json);
    REQUIRE(PayloadDecoder::parseEncoding("text") == ContentEncoding::Raw);
    REQUIRE(PayloadDecoder::parseEncoding("") == ContentEncoding::Raw);
    REQUIRE(PayloadDecoder::encodingName(ContentEncoding::Base64) == "base64");
}

TEST_CASE("PayloadDecoder: decode", "[payload_decoder]") {
    PayloadDecoder decoder;

    SECTION("Base64") {
        auto doc = crow::json::load(R"({"c": "aGVsbG8gd29ybGQ="})");
        auto result = decoder.decode(doc["c"], ContentEncoding::Base64);
        REQUIRE(result.has_value());
        REQUIRE(*result == "hello world");
    }

    SECTION("Base64 data URL") {
        auto doc = crow::json::load(R"({"c": "data:model/gltf-binary;base64,Z2xURg=="})");
        auto result = decoder.decode(doc["c"], ContentEncoding::Base64);
        REQUIRE(result.has_value());
        REQUIRE(*result == "glTF");
    }

    SECTION("Base64 must be a string") {
        auto doc = crow::json::load(R"({"c": 12})");
        auto result = decoder.decode(doc["c"], ContentEncoding::Base64);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::Validation);
    }

    SECTION("Json is pretty printed") {
        auto doc = crow::json::load(R"({"c": {"x": 1}})");
        auto result = decoder.decode(doc["c"], ContentEncoding::Json);
        REQUIRE(result.has_value());
        REQUIRE(*result == "{\n  \"x\": 1\n}");
    }

    SECTION("Raw strings are written as-is") {
        auto doc = crow::json::load(R"({"c": "plain text"})");
        auto result = decoder.decode(doc["c"], ContentEncoding::Raw);
        REQUIRE(result.has_value());
        REQUIRE(*result == "plain text");
    }

    SECTION("Raw non-strings are rejected") {
        auto doc = crow::json::load(R"({"c": [1, 2]})");
        REQUIRE_FALSE(decoder.decode(doc["c"], ContentEncoding::Raw).has_value());
    }
}

TEST_CASE("PayloadDecoder: size limits", "[payload_decoder]") {
    PayloadDecoder::Limits limits;
    limits.max_encoded_bytes = 16;
    limits.max_file_bytes = 8;
    PayloadDecoder decoder(limits);

    SECTION("Encoded length is checked before decoding") {
        auto doc = crow::json::load(R"({"c": "QUFBQUFBQUFBQUFBQUFBQUFBQUE="})");
        auto result = decoder.decode(doc["c"], ContentEncoding::Base64);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::PayloadTooLarge);
        REQUIRE(result.error().http_status_code == 413);
    }

    SECTION("Decoded size is checked") {
        auto doc = crow::json::load(R"({"c": "123456789"})");
        auto result = decoder.decode(doc["c"], ContentEncoding::Raw);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::PayloadTooLarge);
    }

    SECTION("Exactly at the limit passes") {
        auto doc = crow::json::load(R"({"c": "12345678"})");
        REQUIRE(decoder.decode(doc["c"], ContentEncoding::Raw).has_value());
    }
}

TEST_CASE("PayloadDecoder: base64 parsing", "[payload_decoder]") {
    SECTION("Whitespace is ignored") {
        auto result = PayloadDecoder::decodeBase64("aGVs\nbG8=\n");
        REQUIRE(result.has_value());
        REQUIRE(*result == "hello");
    }

    SECTION("Missing padding is accepted") {
        auto result = PayloadDecoder::decodeBase64("aGVsbG8");
        REQUIRE(result.has_value());
        REQUIRE(*result == "hello");
    }

    SECTION("Empty input decodes to nothing") {
        auto result = PayloadDecoder::decodeBase64("");
        REQUIRE(result.has_value());
        REQUIRE(result->empty());
    }

    SECTION("Malformed input is rejected") {
        REQUIRE_FALSE(PayloadDecoder::decodeBase64("abc$").has_value());
        REQUIRE_FALSE(PayloadDecoder::decodeBase64("a").has_value());
        REQUIRE_FALSE(PayloadDecoder::decodeBase64("ab=c").has_value());
        REQUIRE_FALSE(PayloadDecoder::decodeBase64("a===").has_value());
        REQUIRE_FALSE(PayloadDecoder::decodeBase64("data:image/png,abcd").has_value());
    }
}
