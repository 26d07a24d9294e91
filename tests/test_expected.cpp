#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/expected.hpp"
#include <memory>
#include <string>

namespace {

ac::Result<int> parse_positive(int v) {
    if (v <= 0) {
        return ac::fail(ac::ErrorKind::InvalidParameter, "not positive");
    }
    return v;
}

} // namespace

TEST_CASE("expected holds a value", "[expected]") {
    auto r = parse_positive(5);
    REQUIRE(r.has_value());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == 5);
    REQUIRE(*r == 5);
    REQUIRE(r.value_or(0) == 5);
}

TEST_CASE("expected holds an error", "[expected]") {
    auto r = parse_positive(-1);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().kind == ac::ErrorKind::InvalidParameter);
    REQUIRE(r.error().message == "not positive");
    REQUIRE(r.value_or(7) == 7);
}

TEST_CASE("expected copy and move keep the active member", "[expected]") {
    ac::Result<std::string> ok = std::string("abc");
    ac::Result<std::string> bad = ac::fail(ac::ErrorKind::EmptyInput, "none");

    auto ok_copy = ok;
    REQUIRE(ok_copy.value() == "abc");

    ok_copy = bad;
    REQUIRE_FALSE(ok_copy.has_value());
    REQUIRE(ok_copy.error().kind == ac::ErrorKind::EmptyInput);

    auto moved = std::move(ok);
    REQUIRE(moved.value() == "abc");
}

TEST_CASE("expected supports move-only values", "[expected]") {
    ac::expected<std::unique_ptr<int>, ac::Error> r = std::make_unique<int>(42);
    REQUIRE(r.has_value());
    REQUIRE(*r.value() == 42);
    auto owned = std::move(r).value();
    REQUIRE(*owned == 42);
}

TEST_CASE("Error kinds map to stable identifiers", "[error]") {
    using ac::ErrorKind;
    REQUIRE(std::string(ac::to_string(ErrorKind::UnsupportedFormat)) == "unsupported_format");
    REQUIRE(std::string(ac::to_string(ErrorKind::CorruptData)) == "corrupt_data");
    REQUIRE(std::string(ac::to_string(ErrorKind::EmptyInput)) == "empty_input");
    REQUIRE(std::string(ac::to_string(ErrorKind::InvalidOptions)) == "invalid_options");
    REQUIRE(std::string(ac::to_string(ErrorKind::InvalidParameter)) == "invalid_parameter");
    REQUIRE(std::string(ac::to_string(ErrorKind::ProcessingError)) == "processing_error");

    REQUIRE(ac::is_decode_error(ErrorKind::UnsupportedFormat));
    REQUIRE(ac::is_decode_error(ErrorKind::CorruptData));
    REQUIRE_FALSE(ac::is_decode_error(ErrorKind::EmptyInput));

    REQUIRE(ac::describe({ErrorKind::EmptyInput, "no frames"}) == "empty_input: no frames");
}
