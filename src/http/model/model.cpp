//
// Created by rolling-fetch maintainers on 10/18/26.
//

#include "model.hpp"

#include <array>
#include <string>

#include "../../utils/string_utils.hpp"

namespace http::model {
    struct TransferDefaults {
        static constexpr bool FOLLOW_LOCATION = true;
        static constexpr long MAX_REDIRECTS = 5L;
        static constexpr long CONNECT_TIMEOUT_MS = 30'000L;
        static constexpr long TIMEOUT_MS = 30'000L;
        static constexpr const char* USER_AGENT = "rolling-fetch/1.0";
    };

    namespace {
        constexpr std::array<std::pair<Method, const char*>, 7> METHOD_NAMES = {{
            {Method::GET, "GET"},
            {Method::POST, "POST"},
            {Method::PUT, "PUT"},
            {Method::DELETE, "DELETE"},
            {Method::PATCH, "PATCH"},
            {Method::HEAD, "HEAD"},
            {Method::OPTIONS, "OPTIONS"},
        }};

        template <typename T>
        void take_if_set(std::optional<T>& target, const std::optional<T>& source) {
            if (source.has_value()) {
                target = source;
            }
        }
    }  // namespace

    const char* to_string(Method method) {
        for (const auto& [value, name] : METHOD_NAMES) {
            if (value == method) {
                return name;
            }
        }
        return "GET";
    }

    std::optional<Method> method_from_string(std::string_view name) {
        for (const auto& [value, known] : METHOD_NAMES) {
            if (string_utils::ieq(name, known)) {
                return value;
            }
        }
        return std::nullopt;
    }

    bool is_empty(const Body& body) {
        return std::visit([](const auto& payload) { return payload.empty(); }, body);
    }

    TransferOptions TransferOptions::defaults() {
        TransferOptions options;
        options.follow_location_ = TransferDefaults::FOLLOW_LOCATION;
        options.max_redirects_ = TransferDefaults::MAX_REDIRECTS;
        options.connect_timeout_ = std::chrono::milliseconds{TransferDefaults::CONNECT_TIMEOUT_MS};
        options.timeout_ = std::chrono::milliseconds{TransferDefaults::TIMEOUT_MS};
        options.user_agent_ = TransferDefaults::USER_AGENT;
        return options;
    }

    TransferOptions TransferOptions::overlay(const TransferOptions& higher) const {
        TransferOptions out = *this;
        take_if_set(out.follow_location_, higher.follow_location_);
        take_if_set(out.max_redirects_, higher.max_redirects_);
        take_if_set(out.connect_timeout_, higher.connect_timeout_);
        take_if_set(out.timeout_, higher.timeout_);
        take_if_set(out.user_agent_, higher.user_agent_);
        take_if_set(out.accept_encoding_, higher.accept_encoding_);
        take_if_set(out.http_version_, higher.http_version_);
        take_if_set(out.verify_peer_, higher.verify_peer_);
        take_if_set(out.verify_host_, higher.verify_host_);
        take_if_set(out.proxy_, higher.proxy_);
        take_if_set(out.verbose_, higher.verbose_);
        take_if_set(out.tcp_keepalive_, higher.tcp_keepalive_);
        take_if_set(out.low_speed_limit_, higher.low_speed_limit_);
        take_if_set(out.low_speed_time_, higher.low_speed_time_);
        take_if_set(out.cookie_, higher.cookie_);
        take_if_set(out.referer_, higher.referer_);
        return out;
    }

    bool TransferOptions::empty() const { return *this == TransferOptions{}; }

    Request::Request(std::string url, Method method) : url_(std::move(url)), method_(method) {}
}  // namespace http::model
