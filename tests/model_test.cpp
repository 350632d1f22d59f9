#include <catch2/catch.hpp>

#include <chrono>
#include <string>

#include "../src/http/model/model.hpp"
#include "../src/utils/string_utils.hpp"

using namespace http::model;

TEST_CASE("overlay takes only the fields that are set", "[options]") {
    TransferOptions lower = TransferOptions::defaults();

    TransferOptions higher;
    higher.max_redirects_ = 0;
    higher.cookie_ = "session=abc";

    const TransferOptions merged = lower.overlay(higher);
    REQUIRE(merged.max_redirects_ == 0L);
    REQUIRE(merged.cookie_ == "session=abc");
    REQUIRE(merged.follow_location_ == true);
    REQUIRE(merged.connect_timeout_ == std::chrono::milliseconds{30'000});
    REQUIRE(merged.user_agent_ == lower.user_agent_);

    // the source layers are left alone
    REQUIRE(lower.max_redirects_ == 5L);
    REQUIRE_FALSE(lower.cookie_.has_value());
}

TEST_CASE("options with nothing set are empty", "[options]") {
    REQUIRE(TransferOptions{}.empty());
    REQUIRE_FALSE(TransferOptions::defaults().empty());

    TransferOptions one;
    one.verbose_ = false;
    REQUIRE_FALSE(one.empty());
}

TEST_CASE("method names round trip", "[normal]") {
    for (Method m : {Method::GET, Method::POST, Method::PUT, Method::DELETE, Method::PATCH, Method::HEAD, Method::OPTIONS}) {
        REQUIRE(method_from_string(to_string(m)) == m);
    }
    REQUIRE(method_from_string("delete") == Method::DELETE);
    REQUIRE(method_from_string("Patch") == Method::PATCH);
    REQUIRE_FALSE(method_from_string("FETCH").has_value());
    REQUIRE_FALSE(method_from_string("").has_value());
}

TEST_CASE("a new request has no result", "[normal]") {
    Request subject("http://example.test/", Method::PUT);
    REQUIRE(subject.url_ == "http://example.test/");
    REQUIRE(subject.method_ == Method::PUT);
    REQUIRE_FALSE(subject.is_completed());
    REQUIRE_FALSE(subject.has_body());
    REQUIRE(subject.headers_.empty());
    REQUIRE(subject.options_.empty());
    REQUIRE_FALSE(subject.extra_info_.has_value());
}

TEST_CASE("raw and form bodies", "[normal]") {
    Request subject("http://example.test/");

    subject.body_ = std::string{};
    REQUIRE_FALSE(subject.has_body());

    subject.body_ = std::string{"payload"};
    REQUIRE(subject.has_body());

    subject.body_ = FormFields{};
    REQUIRE_FALSE(subject.has_body());

    subject.body_ = FormFields{{"q", "rolling"}};
    REQUIRE(subject.has_body());
}

TEST_CASE("header lines split on the first colon", "[normal]") {
    REQUIRE(string_utils::split_header_line("X-A: 1") == std::pair<std::string, std::string>{"X-A", "1"});
    REQUIRE(string_utils::split_header_line("Host:example.test:8080") == std::pair<std::string, std::string>{"Host", "example.test:8080"});
    REQUIRE(string_utils::split_header_line("  Accept  ").first == "Accept");
    REQUIRE(string_utils::split_header_line(": nameless").first.empty());
    REQUIRE(string_utils::ieq("Content-Type", "content-type"));
    REQUIRE_FALSE(string_utils::ieq("Content-Type", "content-length"));
}
