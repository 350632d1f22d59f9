//
// Created by rolling-fetch maintainers on 10/18/26.
// libcurl multi-interface implementation of ITransferMultiplexer.
//

#ifndef ROLLING_FETCH_CURL_MULTI_HPP
#define ROLLING_FETCH_CURL_MULTI_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "../model/model.hpp"
#include "interface.hpp"

namespace http::client {

    class CurlMulti : public ITransferMultiplexer {
       public:
        CurlMulti();

        ~CurlMulti() override;
        CurlMulti(const CurlMulti&) = delete;
        CurlMulti& operator=(const CurlMulti&) = delete;
        CurlMulti(CurlMulti&&) = delete;
        CurlMulti& operator=(CurlMulti&&) = delete;

        TransferHandle submit(const PreparedTransfer& transfer) override;
        MultiStatus progress() override;
        std::optional<Completion> next_completed() override;
        void remove(TransferHandle handle) override;
        MultiStatus wait(std::chrono::milliseconds timeout) override;
        void close() override;

       private:
        // Everything libcurl points into while the easy handle is attached.
        struct Transfer {
            Transfer();

            ~Transfer();
            Transfer(const Transfer&) = delete;
            Transfer& operator=(const Transfer&) = delete;
            Transfer(Transfer&&) = delete;
            Transfer& operator=(Transfer&&) = delete;

            TransferHandle handle_{};
            CURL* easy_{};
            curl_slist* headers_{};
            std::string body_;
            std::array<char, CURL_ERROR_SIZE> error_buf_{};
        };

        static void apply_body(Transfer& t, const PreparedTransfer& transfer);
        static void apply_headers(Transfer& t, const http::model::Headers& headers);
        static void apply_options(Transfer& t, const http::model::TransferOptions& options);
        static http::model::Response make_response(Transfer& t, CURLcode result);
        static std::string encode_form(CURL* easy, const http::model::FormFields& fields);

        // Detaches and frees every transfer, then the multi handle. Returns the first detach failure.
        CURLMcode release() noexcept;

        CURLM* multi_{};
        TransferHandle next_handle_ = 1;
        std::map<TransferHandle, std::unique_ptr<Transfer>> transfers_;
    };

}  // namespace http::client

#endif
