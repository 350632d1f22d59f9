#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../src/http/store/response_store.hpp"

namespace {
    std::string slurp(const std::filesystem::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
}  // namespace

TEST_CASE("completed responses land on disk", "[store]") {
    const auto root = std::filesystem::temp_directory_path() / "rolling_fetch_store_test";
    std::filesystem::remove_all(root);

    http::store::ResponseStore subject(root);

    http::model::Request request("http://example.test/page");
    http::model::Response response;
    response.body_ = "<html>hi</html>";
    response.info_.status_ = 200;
    response.info_.content_type_ = "text/html";
    request.response_ = response;

    const auto base = subject.save(request);
    REQUIRE(base.string() == subject.base_path_for(request).string());
    REQUIRE(slurp(base.string() + ".body") == "<html>hi</html>");

    const std::string meta = slurp(base.string() + ".meta");
    REQUIRE(meta.find("status: 200\n") != std::string::npos);
    REQUIRE(meta.find("url: http://example.test/page\n") != std::string::npos);
    REQUIRE(meta.find("content_type: text/html\n") != std::string::npos);
    REQUIRE_FALSE(std::filesystem::exists(base.string() + ".body.tmp"));

    std::filesystem::remove_all(root);
}

TEST_CASE("method is part of the stored name", "[store]") {
    const auto root = std::filesystem::temp_directory_path() / "rolling_fetch_store_key_test";
    http::store::ResponseStore subject(root);

    http::model::Request get("http://example.test/item", http::model::Method::GET);
    http::model::Request del("http://example.test/item", http::model::Method::DELETE);
    REQUIRE(subject.base_path_for(get).string() != subject.base_path_for(del).string());

    std::filesystem::remove_all(root);
}

TEST_CASE("unfinished requests cannot be stored", "[store][error]") {
    const auto root = std::filesystem::temp_directory_path() / "rolling_fetch_store_error_test";
    http::store::ResponseStore subject(root);

    http::model::Request pending("http://example.test/later");
    REQUIRE_THROWS_AS(subject.save(pending), std::logic_error);

    std::filesystem::remove_all(root);
}
