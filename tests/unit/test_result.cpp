#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace larder;

TEST_CASE("Result::ok and Result::err", "[result]") {
    auto ok = Res<int>::ok(42);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.unwrap() == 42);

    auto err = Res<int>::err(Error::of(ErrorKind::NotFound, "item i1 not found", 404));
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(err.unwrap_err().code == 404);
    REQUIRE(err.unwrap_err().message == "item i1 not found");
}

TEST_CASE("Result::unwrap throws with the error message", "[result]") {
    auto result = Res<int>::err(Error{"disk I/O error"});
    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
    REQUIRE_THROWS_AS(Res<int>::ok(1).unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or", "[result]") {
    REQUIRE(Res<int>::ok(42).value_or(0) == 42);
    REQUIRE(Res<int>::err(Error{"error"}).value_or(0) == 0);
}

TEST_CASE("Result::map and and_then", "[result]") {
    auto divide = [](int x) -> Res<int> {
        if (x == 0) return Res<int>::err(Error::of(ErrorKind::InvalidArgument, "division by zero"));
        return Res<int>::ok(100 / x);
    };

    SECTION("map transforms the value") {
        auto mapped = Res<int>::ok(21).map([](int x) { return x * 2; });
        REQUIRE(mapped.unwrap() == 42);
    }

    SECTION("map changes the value type") {
        auto mapped = Res<int>::ok(5)
            .map([](int x) { return std::to_string(x); })
            .map([](const std::string& s) { return s + " items"; });
        REQUIRE(mapped.unwrap() == "5 items");
    }

    SECTION("and_then chains") {
        REQUIRE(Res<int>::ok(5).and_then(divide).unwrap() == 20);
        REQUIRE(Res<int>::ok(0).and_then(divide).unwrap_err().kind == ErrorKind::InvalidArgument);
    }

    SECTION("errors short-circuit") {
        auto result = Res<int>::err(Error{"initial error"}).and_then(divide);
        REQUIRE(result.unwrap_err().message == "initial error");
    }
}

TEST_CASE("Result::inspect_err only sees errors", "[result]") {
    int seen = 0;
    (void)Res<int>::ok(1).inspect_err([&](const Error&) { seen++; });
    (void)Status::err(Error{"x"}).inspect_err([&](const Error&) { seen++; });
    REQUIRE(seen == 1);
}

TEST_CASE("Status", "[result]") {
    REQUIRE(Status::ok().is_ok());
    REQUIRE_NOTHROW(Status::ok().unwrap());
    REQUIRE_THROWS(Status::err(Error{"error"}).unwrap());

    auto chained = Status::ok().and_then([] { return Res<int>::ok(7); });
    REQUIRE(chained.unwrap() == 7);
}

TEST_CASE("forward_err keeps the error across value types", "[result]") {
    const auto failed = Res<std::string>::err(Error::of(ErrorKind::Corrupted, "bad row", 11));
    auto forwarded = forward_err<int>(failed);
    REQUIRE(forwarded.is_err());
    REQUIRE(forwarded.unwrap_err() == failed.unwrap_err());
}

TEST_CASE("Only transport and server failures are retryable", "[result]") {
    REQUIRE(Error::of(ErrorKind::NetworkError, "timeout").retryable());
    REQUIRE(Error::of(ErrorKind::ServerRejection, "HTTP 503", 503).retryable());
    REQUIRE_FALSE(Error::of(ErrorKind::VersionConflict, "stale", 409).retryable());
    REQUIRE_FALSE(Error::of(ErrorKind::InvalidArgument, "bad").retryable());
    REQUIRE_FALSE(Error::of(ErrorKind::StorageQuotaExceeded, "full").retryable());
    REQUIRE_FALSE(Error::of(ErrorKind::TerminalSyncFailure, "gave up").retryable());
    REQUIRE(to_string(ErrorKind::StorageQuotaExceeded) == "storage_quota_exceeded");
}
