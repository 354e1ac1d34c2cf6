#include <catch2/catch_test_macros.hpp>
#include "storage/field_codec.hpp"
#include "crypto/checksum.hpp"

using namespace larder;
using namespace larder::storage;

TEST_CASE("Field maps encode to canonical JSON", "[unit][codec]") {
    const Fields fields{{"quantity", int64_t{3}},
                        {"name", std::string("Widget")},
                        {"tags", StringList{"a"}},
                        {"supplier", std::monostate{}}};
    const auto json = encode_fields(fields);
    REQUIRE(json == R"({"name":"Widget","quantity":3,"supplier":null,"tags":["a"]})");

    auto decoded = decode_fields(json);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == fields);

    // Equal maps give equal checksums.
    REQUIRE(crypto::checksum(json) == crypto::checksum(encode_fields(decoded.unwrap())));
}

TEST_CASE("Numbers decode by shape", "[unit][codec]") {
    REQUIRE(decode_value("[4]").unwrap() == FieldValue{int64_t{4}});
    REQUIRE(decode_value("[4.0]").unwrap() == FieldValue{int64_t{4}});
    REQUIRE(decode_value("[4.25]").unwrap() == FieldValue{4.25});
    REQUIRE(decode_value("[-7]").unwrap() == FieldValue{int64_t{-7}});
}

TEST_CASE("Single values round trip through a wrapper array", "[unit][codec]") {
    REQUIRE(encode_value(std::string("x")) == R"(["x"])");
    REQUIRE(decode_value(encode_value(true)).unwrap() == FieldValue{true});
    REQUIRE(is_null(decode_value("[null]").unwrap()));
}

TEST_CASE("Malformed JSON is reported, never guessed at", "[unit][codec]") {
    SECTION("Broken text is corruption") {
        auto bad = decode_fields("{\"name\":");
        REQUIRE(bad.is_err());
        REQUIRE(bad.unwrap_err().kind == ErrorKind::Corrupted);
    }

    SECTION("A field map must be an object") {
        REQUIRE(decode_fields("[1, 2]").unwrap_err().kind == ErrorKind::Corrupted);
    }

    SECTION("Nested objects are not field values") {
        auto nested = decode_fields(R"({"name":{"first":"a"}})");
        REQUIRE(nested.is_err());
        REQUIRE(nested.unwrap_err().message.find("name") != std::string::npos);
    }

    SECTION("Lists hold strings only") {
        REQUIRE(decode_value("[[1, 2]]").unwrap_err().kind == ErrorKind::InvalidArgument);
    }

    SECTION("A value wrapper holds exactly one element") {
        REQUIRE(decode_value("[1, 2]").is_err());
    }
}

TEST_CASE("Checksums", "[unit][codec]") {
    const auto sum = crypto::checksum("payload");
    REQUIRE(sum.size() == crypto::CHECKSUM_BYTES * 2);
    REQUIRE(crypto::checksum_matches("payload", sum));
    REQUIRE_FALSE(crypto::checksum_matches("payloaD", sum));
    REQUIRE_FALSE(crypto::checksum_matches("payload", ""));
}
