//
// Created by rolling-fetch maintainers on 10/18/26.
//

#ifndef ROLLING_FETCH_MODEL_HPP
#define ROLLING_FETCH_MODEL_HPP

#include <any>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace http::model {
    enum class Method { GET, POST, PUT, DELETE, PATCH, HEAD, OPTIONS };

    enum class HttpVersion { DEFAULT, HTTP_1_0, HTTP_1_1, HTTP_2, HTTP_2_TLS, HTTP_3 };

    // Each entry is a complete "Name: value" line.
    using Headers = std::vector<std::string>;

    using FormFields = std::vector<std::pair<std::string, std::string>>;

    // Raw payload or a form that is url-encoded when the transfer is submitted.
    using Body = std::variant<std::string, FormFields>;

    [[nodiscard]] const char* to_string(Method method);
    [[nodiscard]] std::optional<Method> method_from_string(std::string_view name);
    [[nodiscard]] bool is_empty(const Body& body);

    struct TransferOptions {
        std::optional<bool> follow_location_;
        std::optional<long> max_redirects_;
        std::optional<std::chrono::milliseconds> connect_timeout_;
        std::optional<std::chrono::milliseconds> timeout_;
        std::optional<std::string> user_agent_;
        std::optional<std::string> accept_encoding_;
        std::optional<HttpVersion> http_version_;
        std::optional<bool> verify_peer_;
        std::optional<bool> verify_host_;
        std::optional<std::string> proxy_;
        std::optional<bool> verbose_;
        std::optional<bool> tcp_keepalive_;
        std::optional<long> low_speed_limit_;
        std::optional<std::chrono::seconds> low_speed_time_;
        std::optional<std::string> cookie_;
        std::optional<std::string> referer_;

        // Safe defaults that sit underneath every other layer.
        static TransferOptions defaults();

        // Copy of *this with every field that is set in `higher` taking its value from `higher`.
        [[nodiscard]] TransferOptions overlay(const TransferOptions& higher) const;

        [[nodiscard]] bool empty() const;

        bool operator==(const TransferOptions&) const = default;
    };

    struct TransferInfo {
        long status_ = 0;
        long redirect_count_ = 0;
        long long size_download_ = 0;

        double name_lookup_time_s_ = 0.0;
        double connect_time_s_ = 0.0;
        double start_transfer_time_s_ = 0.0;
        double total_time_s_ = 0.0;

        std::string effective_url_;
        std::string content_type_;
        std::string primary_ip_;
    };

    struct Response {
        int error_code_ = 0;
        std::string error_message_;
        std::string body_;
        TransferInfo info_;

        [[nodiscard]] bool ok() const { return error_code_ == 0; }
    };

    struct Request {
        Request() = default;
        explicit Request(std::string url, Method method = Method::GET);

        std::string url_;
        Method method_ = Method::GET;
        Body body_;
        Headers headers_;
        TransferOptions options_;

        // Caller payload carried through to the completion callback untouched.
        std::any extra_info_;

        // Unset until the request completes, then written once.
        std::optional<Response> response_;

        [[nodiscard]] bool has_body() const { return !is_empty(body_); }
        [[nodiscard]] bool is_completed() const { return response_.has_value(); }
    };
}  // namespace http::model

#endif
