//
// Created by rolling-fetch maintainers on 10/18/26.
//

#include "curl_multi.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <climits>
#include <stdexcept>
#include <string>
#include <variant>

#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

namespace http::client {

    struct CurlFlags {
        static constexpr long ON = 1L;
        static constexpr long OFF = 0L;
        static constexpr long VERIFY_HOST_STRICT = 2L;
    };

    namespace {
        template <typename T>
        void setopt(CURL* easy, CURLoption option, T value) {
            const auto rc = curl_easy_setopt(easy, option, value);

            if (rc != CURLE_OK) {
                throw http::http_error::SubmitError(static_cast<int>(rc), std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
            }
        }

        size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) { return string_utils::write_to_string(ptr, size, nmemb, userdata); }

        long to_curl_http_version(http::model::HttpVersion version) {
            switch (version) {
                case http::model::HttpVersion::HTTP_1_0:
                    return CURL_HTTP_VERSION_1_0;
                case http::model::HttpVersion::HTTP_1_1:
                    return CURL_HTTP_VERSION_1_1;
                case http::model::HttpVersion::HTTP_2:
                    return CURL_HTTP_VERSION_2_0;
                case http::model::HttpVersion::HTTP_2_TLS:
                    return CURL_HTTP_VERSION_2TLS;
                case http::model::HttpVersion::HTTP_3:
                    return CURL_HTTP_VERSION_3;
                case http::model::HttpVersion::DEFAULT:
                    break;
            }
            return CURL_HTTP_VERSION_NONE;
        }

        long as_flag(bool value) { return value ? CurlFlags::ON : CurlFlags::OFF; }

        std::string as_string(const char* value) { return value != nullptr ? std::string(value) : std::string{}; }
    }  // namespace

    CurlMulti::Transfer::Transfer() : easy_(curl_easy_init()) {
        if (easy_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }
    }

    CurlMulti::Transfer::~Transfer() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (easy_ != nullptr) {
            curl_easy_cleanup(easy_);
        }
    }

    CurlMulti::CurlMulti() : multi_(curl_multi_init()) {
        if (multi_ == nullptr) {
            throw std::runtime_error("Failed to create CURL multi handle");
        }
    }

    CurlMulti::~CurlMulti() { release(); }

    TransferHandle CurlMulti::submit(const PreparedTransfer& transfer) {
        if (multi_ == nullptr) {
            throw std::runtime_error("submit on a closed CURL multi handle");
        }

        auto t = std::make_unique<Transfer>();
        t->handle_ = next_handle_++;

        setopt(t->easy_, CURLOPT_URL, transfer.url_.c_str());
        setopt(t->easy_, CURLOPT_ERRORBUFFER, t->error_buf_.data());
        setopt(t->easy_, CURLOPT_WRITEFUNCTION, &write_body);
        setopt(t->easy_, CURLOPT_WRITEDATA, static_cast<void*>(&t->body_));
        setopt(t->easy_, CURLOPT_PRIVATE, static_cast<void*>(t.get()));
        setopt(t->easy_, CURLOPT_NOPROGRESS, CurlFlags::ON);
        setopt(t->easy_, CURLOPT_NOSIGNAL, CurlFlags::ON);

        if (transfer.method_ == http::model::Method::HEAD) {
            setopt(t->easy_, CURLOPT_NOBODY, CurlFlags::ON);
        } else if (transfer.method_ != http::model::Method::GET || transfer.body_.has_value()) {
            setopt(t->easy_, CURLOPT_CUSTOMREQUEST, http::model::to_string(transfer.method_));
        }

        apply_body(*t, transfer);
        apply_headers(*t, transfer.headers_);
        apply_options(*t, transfer.options_);

        const auto rc = curl_multi_add_handle(multi_, t->easy_);
        if (rc != CURLM_OK) {
            throw std::runtime_error(std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(rc));
        }

        const TransferHandle handle = t->handle_;
        transfers_.emplace(handle, std::move(t));
        return handle;
    }

    void CurlMulti::apply_body(Transfer& t, const PreparedTransfer& transfer) {
        if (!transfer.body_.has_value()) {
            return;
        }

        const std::string payload = std::holds_alternative<std::string>(*transfer.body_)
                                        ? std::get<std::string>(*transfer.body_)
                                        : encode_form(t.easy_, std::get<http::model::FormFields>(*transfer.body_));

        // A body always goes out through the POST machinery; CUSTOMREQUEST keeps the verb.
        setopt(t.easy_, CURLOPT_POST, CurlFlags::ON);
        setopt(t.easy_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
        setopt(t.easy_, CURLOPT_COPYPOSTFIELDS, payload.c_str());
    }

    void CurlMulti::apply_headers(Transfer& t, const http::model::Headers& headers) {
        for (const auto& h : headers) {
            curl_slist* appended = curl_slist_append(t.headers_, h.c_str());
            if (appended == nullptr) {
                throw http::http_error::SubmitError(static_cast<int>(CURLE_OUT_OF_MEMORY), "curl_slist_append failed for header: " + h);
            }
            t.headers_ = appended;
        }
        if (t.headers_ != nullptr) {
            setopt(t.easy_, CURLOPT_HEADER, CurlFlags::OFF);
            setopt(t.easy_, CURLOPT_HTTPHEADER, t.headers_);
        }
    }

    void CurlMulti::apply_options(Transfer& t, const http::model::TransferOptions& options) {
        if (options.follow_location_) {
            setopt(t.easy_, CURLOPT_FOLLOWLOCATION, as_flag(*options.follow_location_));
        }
        if (options.max_redirects_) {
            setopt(t.easy_, CURLOPT_MAXREDIRS, *options.max_redirects_);
        }
        if (options.connect_timeout_) {
            setopt(t.easy_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout_->count()));
        }
        if (options.timeout_) {
            setopt(t.easy_, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout_->count()));
        }
        if (options.user_agent_) {
            setopt(t.easy_, CURLOPT_USERAGENT, options.user_agent_->c_str());
        }
        if (options.accept_encoding_) {
            // Empty string => accept all supported encodings
            setopt(t.easy_, CURLOPT_ACCEPT_ENCODING, options.accept_encoding_->c_str());
        }
        if (options.http_version_) {
            setopt(t.easy_, CURLOPT_HTTP_VERSION, to_curl_http_version(*options.http_version_));
        }
        if (options.verify_peer_) {
            setopt(t.easy_, CURLOPT_SSL_VERIFYPEER, as_flag(*options.verify_peer_));
        }
        if (options.verify_host_) {
            setopt(t.easy_, CURLOPT_SSL_VERIFYHOST, *options.verify_host_ ? CurlFlags::VERIFY_HOST_STRICT : CurlFlags::OFF);
        }
        if (options.proxy_) {
            setopt(t.easy_, CURLOPT_PROXY, options.proxy_->c_str());
        }
        if (options.verbose_) {
            setopt(t.easy_, CURLOPT_VERBOSE, as_flag(*options.verbose_));
        }
        if (options.tcp_keepalive_) {
            setopt(t.easy_, CURLOPT_TCP_KEEPALIVE, as_flag(*options.tcp_keepalive_));
        }
        if (options.low_speed_limit_) {
            setopt(t.easy_, CURLOPT_LOW_SPEED_LIMIT, *options.low_speed_limit_);
        }
        if (options.low_speed_time_) {
            setopt(t.easy_, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.low_speed_time_->count()));
        }
        if (options.cookie_) {
            setopt(t.easy_, CURLOPT_COOKIE, options.cookie_->c_str());
        }
        if (options.referer_) {
            setopt(t.easy_, CURLOPT_REFERER, options.referer_->c_str());
        }
    }

    std::string CurlMulti::encode_form(CURL* easy, const http::model::FormFields& fields) {
        std::string out;
        for (const auto& [key, value] : fields) {
            char* k = curl_easy_escape(easy, key.c_str(), static_cast<int>(key.size()));
            char* v = curl_easy_escape(easy, value.c_str(), static_cast<int>(value.size()));
            if (k == nullptr || v == nullptr) {
                curl_free(k);
                curl_free(v);
                throw http::http_error::SubmitError(static_cast<int>(CURLE_OUT_OF_MEMORY), "curl_easy_escape failed for form field: " + key);
            }
            if (!out.empty()) {
                out += '&';
            }
            out.append(k).append("=").append(v);
            curl_free(k);
            curl_free(v);
        }
        return out;
    }

    MultiStatus CurlMulti::progress() {
        MultiStatus status;
        CURLMcode rc = CURLM_OK;

        do {
            rc = curl_multi_perform(multi_, &status.still_running_);
        } while (rc == CURLM_CALL_MULTI_PERFORM);

        if (rc != CURLM_OK) {
            status.code_ = static_cast<int>(rc);
            status.message_ = curl_multi_strerror(rc);
        }
        return status;
    }

    std::optional<Completion> CurlMulti::next_completed() {
        int msgs_left = 0;
        CURLMsg* msg = nullptr;

        while ((msg = curl_multi_info_read(multi_, &msgs_left)) != nullptr) {
            if (msg->msg != CURLMSG_DONE) {
                continue;
            }

            void* priv = nullptr;
            curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
            auto* t = static_cast<Transfer*>(priv);
            if (t == nullptr) {
                throw std::runtime_error("Finished CURL handle carries no transfer");
            }

            return Completion{.handle_ = t->handle_, .response_ = make_response(*t, msg->data.result)};
        }

        return std::nullopt;
    }

    http::model::Response CurlMulti::make_response(Transfer& t, CURLcode result) {
        http::model::Response r;
        r.error_code_ = static_cast<int>(result);
        if (result != CURLE_OK) {
            r.error_message_ = t.error_buf_[0] != '\0' ? std::string(t.error_buf_.data()) : std::string(curl_easy_strerror(result));
        }
        r.body_ = std::move(t.body_);

        char* effective_url = nullptr;
        char* content_type = nullptr;
        char* primary_ip = nullptr;
        curl_off_t size_download = 0;

        curl_easy_getinfo(t.easy_, CURLINFO_RESPONSE_CODE, &r.info_.status_);
        curl_easy_getinfo(t.easy_, CURLINFO_REDIRECT_COUNT, &r.info_.redirect_count_);
        curl_easy_getinfo(t.easy_, CURLINFO_EFFECTIVE_URL, &effective_url);
        curl_easy_getinfo(t.easy_, CURLINFO_CONTENT_TYPE, &content_type);
        curl_easy_getinfo(t.easy_, CURLINFO_PRIMARY_IP, &primary_ip);
        curl_easy_getinfo(t.easy_, CURLINFO_SIZE_DOWNLOAD_T, &size_download);
        curl_easy_getinfo(t.easy_, CURLINFO_NAMELOOKUP_TIME, &r.info_.name_lookup_time_s_);
        curl_easy_getinfo(t.easy_, CURLINFO_CONNECT_TIME, &r.info_.connect_time_s_);
        curl_easy_getinfo(t.easy_, CURLINFO_STARTTRANSFER_TIME, &r.info_.start_transfer_time_s_);
        curl_easy_getinfo(t.easy_, CURLINFO_TOTAL_TIME, &r.info_.total_time_s_);

        r.info_.effective_url_ = as_string(effective_url);
        r.info_.content_type_ = as_string(content_type);
        r.info_.primary_ip_ = as_string(primary_ip);
        r.info_.size_download_ = static_cast<long long>(size_download);
        return r;
    }

    void CurlMulti::remove(TransferHandle handle) {
        auto it = transfers_.find(handle);
        if (it == transfers_.end()) {
            throw std::out_of_range("Unknown transfer handle: " + std::to_string(handle));
        }

        const auto rc = curl_multi_remove_handle(multi_, it->second->easy_);
        transfers_.erase(it);

        if (rc != CURLM_OK) {
            throw std::runtime_error(std::string("curl_multi_remove_handle failed: ") + curl_multi_strerror(rc));
        }
    }

    MultiStatus CurlMulti::wait(std::chrono::milliseconds timeout) {
        MultiStatus status;
        const auto timeout_ms = static_cast<int>(std::min<long long>(timeout.count(), INT_MAX));

        // Unlike curl_multi_wait, poll sleeps for the full timeout when there is nothing to watch.
        const auto rc = curl_multi_poll(multi_, nullptr, 0, timeout_ms, nullptr);
        if (rc != CURLM_OK) {
            status.code_ = static_cast<int>(rc);
            status.message_ = curl_multi_strerror(rc);
        }
        return status;
    }

    void CurlMulti::close() {
        const auto rc = release();
        if (rc != CURLM_OK) {
            throw http::http_error::TransportError(static_cast<int>(rc), "curl_multi_remove_handle", curl_multi_strerror(rc));
        }
    }

    CURLMcode CurlMulti::release() noexcept {
        CURLMcode first_failure = CURLM_OK;

        for (auto& [handle, t] : transfers_) {
            if (multi_ == nullptr) {
                break;
            }
            const auto rc = curl_multi_remove_handle(multi_, t->easy_);
            if (rc != CURLM_OK && first_failure == CURLM_OK) {
                first_failure = rc;
            }
        }
        transfers_.clear();

        if (multi_ != nullptr) {
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
        }
        return first_failure;
    }

}  // namespace http::client
