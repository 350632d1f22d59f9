#include <catch2/catch.hpp>

#include <curl/curl.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

#include "../src/http/client/curl_multi.hpp"
#include "../src/http/error/http_error.hpp"
#include "../src/rolling/scheduler/rolling_scheduler.hpp"

// Transfers here use file:// so that libcurl does real work without a network.

namespace {
    struct TempFiles {
        std::filesystem::path root_ = std::filesystem::temp_directory_path() / "rolling_fetch_curl_multi_test";

        TempFiles() { std::filesystem::create_directories(root_); }
        ~TempFiles() { std::filesystem::remove_all(root_); }
        TempFiles(const TempFiles&) = delete;
        TempFiles& operator=(const TempFiles&) = delete;
        TempFiles(TempFiles&&) = delete;
        TempFiles& operator=(TempFiles&&) = delete;

        std::string write(const std::string& name, const std::string& content) const {
            const auto p = root_ / name;
            std::ofstream out(p, std::ios::binary);
            out << content;
            return "file://" + p.string();
        }

        [[nodiscard]] std::string missing(const std::string& name) const { return "file://" + (root_ / name).string(); }
    };
}  // namespace

TEST_CASE("curl multi fetches local files", "[curl]") {
    TempFiles files;
    const std::string url = files.write("one.txt", "first file");

    http::client::CurlMulti subject;
    http::client::PreparedTransfer transfer;
    transfer.url_ = url;
    transfer.options_ = http::model::TransferOptions::defaults();

    const auto handle = subject.submit(transfer);

    std::optional<http::client::Completion> done;
    for (int round = 0; round < 100 && !done; ++round) {
        REQUIRE(subject.progress().ok());
        done = subject.next_completed();
        if (!done) {
            REQUIRE(subject.wait(std::chrono::milliseconds{20}).ok());
        }
    }

    REQUIRE(done.has_value());
    REQUIRE(done->handle_ == handle);
    REQUIRE(done->response_.ok());
    REQUIRE(done->response_.body_ == "first file");
    REQUIRE(done->response_.info_.effective_url_ == url);
    REQUIRE(done->response_.info_.size_download_ == 10);

    REQUIRE_FALSE(subject.next_completed().has_value());
    subject.remove(handle);
    REQUIRE_THROWS_AS(subject.remove(handle), std::out_of_range);
    subject.close();
}

TEST_CASE("rolling scheduler over curl multi", "[curl]") {
    TempFiles files;

    rolling::RollingScheduler subject;
    subject.set_window(3).set_wait_timeout(std::chrono::milliseconds{50});

    for (int i = 0; i < 8; ++i) {
        subject.get(files.write("page" + std::to_string(i) + ".txt", "page " + std::to_string(i)));
    }
    subject.get(files.missing("absent.txt"));

    size_t failures = 0;
    subject.set_callback([&failures](http::model::Request& request, rolling::IRequestQueue&) {
        if (!request.response_->ok()) {
            ++failures;
            REQUIRE(request.response_->error_code_ == CURLE_FILE_COULDNT_READ_FILE);
            REQUIRE_FALSE(request.response_->error_message_.empty());
        }
    });

    subject.run();

    REQUIRE(subject.count_completed() == 9);
    REQUIRE(subject.count_pending() == 0);
    REQUIRE(subject.count_active() == 0);
    REQUIRE(failures == 1);

    for (const auto& request : subject.get_completed_requests()) {
        if (request->response_->ok()) {
            REQUIRE(request->response_->body_.rfind("page ", 0) == 0);
        }
    }
}

TEST_CASE("curl multi refuses a transfer with a negative timeout", "[curl]") {
    TempFiles files;

    http::client::CurlMulti subject;
    http::client::PreparedTransfer transfer;
    transfer.url_ = files.write("refused.txt", "never read");
    transfer.options_.timeout_ = std::chrono::milliseconds{-1};

    try {
        subject.submit(transfer);
        FAIL("submit() should have thrown");
    } catch (const http::http_error::SubmitError& e) {
        REQUIRE(e.code_ == CURLE_BAD_FUNCTION_ARGUMENT);
    }
    subject.close();
}

TEST_CASE("a refused transfer does not stop the others", "[curl]") {
    TempFiles files;

    rolling::RollingScheduler subject;
    subject.set_window(2).set_wait_timeout(std::chrono::milliseconds{50});

    http::model::TransferOptions broken;
    broken.timeout_ = std::chrono::milliseconds{-1};

    subject.get(files.write("a.txt", "a"));
    subject.get(files.write("b.txt", "b"), std::nullopt, broken);
    subject.get(files.write("c.txt", "c"));

    subject.run();

    REQUIRE(subject.count_completed() == 3);
    REQUIRE(subject.count_pending() == 0);
    for (const auto& request : subject.get_completed_requests()) {
        if (request->url_.ends_with("b.txt")) {
            REQUIRE(request->response_->error_code_ == CURLE_BAD_FUNCTION_ARGUMENT);
            REQUIRE_FALSE(request->response_->error_message_.empty());
        } else {
            REQUIRE(request->response_->ok());
        }
    }
}
