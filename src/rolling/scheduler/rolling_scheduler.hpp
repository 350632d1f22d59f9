//
// Created by rolling-fetch maintainers on 10/18/26.
//

#ifndef ROLLING_FETCH_ROLLING_SCHEDULER_HPP
#define ROLLING_FETCH_ROLLING_SCHEDULER_HPP

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../http/client/interface.hpp"
#include "../../http/model/model.hpp"
#include "interface.hpp"

namespace rolling {
    using Callback = std::function<void(http::model::Request&, IRequestQueue&)>;
    using MultiplexerFactory = std::function<std::unique_ptr<http::client::ITransferMultiplexer>()>;

    //
    // Keeps a fixed number of transfers in flight until every queued request is done.
    //
    // A request is always in exactly one of pending, active or completed. run() admits
    // up to `window` requests, then refills one slot as soon as each transfer finishes
    // and hands the finished request to the callback. Completion order is whatever the
    // transport reports, not submission order.
    //
    class RollingScheduler : public IRequestQueue {
       public:
        // Uses libcurl's multi interface. A http::client::CurlGlobal must be alive around run().
        RollingScheduler();
        explicit RollingScheduler(MultiplexerFactory multiplexer_factory);

        RollingScheduler& add(RequestPtr request) override;
        RollingScheduler& add(http::model::Request request);
        RollingScheduler& request(std::string url, http::model::Method method = http::model::Method::GET,
                                  std::optional<http::model::Body> body = std::nullopt, std::optional<http::model::Headers> headers = std::nullopt,
                                  std::optional<http::model::TransferOptions> options = std::nullopt) override;
        RollingScheduler& get(std::string url, std::optional<http::model::Headers> headers = std::nullopt,
                              std::optional<http::model::TransferOptions> options = std::nullopt) override;
        RollingScheduler& post(std::string url, std::optional<http::model::Body> body = std::nullopt,
                               std::optional<http::model::Headers> headers = std::nullopt,
                               std::optional<http::model::TransferOptions> options = std::nullopt) override;
        RollingScheduler& put(std::string url, std::optional<http::model::Body> body = std::nullopt,
                              std::optional<http::model::Headers> headers = std::nullopt,
                              std::optional<http::model::TransferOptions> options = std::nullopt) override;
        RollingScheduler& del(std::string url, std::optional<http::model::Headers> headers = std::nullopt,
                              std::optional<http::model::TransferOptions> options = std::nullopt) override;

        RollingScheduler& set_callback(Callback callback);

        // Throws std::invalid_argument for fewer than 2 simultaneous transfers.
        RollingScheduler& set_window(long count);

        // Upper bound on each blocking wait for I/O. Throws std::invalid_argument when negative.
        RollingScheduler& set_wait_timeout(std::chrono::milliseconds timeout);

        RollingScheduler& set_base_options(http::model::TransferOptions options);
        // Fields set in `options` replace the current base values; the rest are kept.
        RollingScheduler& merge_base_options(const http::model::TransferOptions& options);
        RollingScheduler& set_default_headers(http::model::Headers headers);

        [[nodiscard]] const Callback& get_callback() const;
        [[nodiscard]] std::size_t get_window() const;
        [[nodiscard]] std::chrono::milliseconds get_wait_timeout() const;
        [[nodiscard]] const http::model::TransferOptions& get_base_options() const;
        [[nodiscard]] const http::model::Headers& get_default_headers() const;

        // Blocks until pending and active are both empty.
        // A request the transport refuses to submit completes at once with the refusal as its error.
        // Throws http::http_error::TransportError if the transport fails as a whole; every request
        // still in flight is then put back at the front of pending, unanswered.
        void run();

        // Everything needed to submit `request`: defaults < base options < request options,
        // request headers or else the default headers.
        [[nodiscard]] http::client::PreparedTransfer prepare_transfer(const http::model::Request& request) const;

        // Removes and returns up to `limit` requests from the front of pending.
        std::vector<RequestPtr> next_pending_requests(std::size_t limit = 1);
        RequestPtr next_pending_request();

        [[nodiscard]] const std::vector<RequestPtr>& get_completed_requests() const;

        // Drops the completed requests. count_completed(true) keeps counting.
        RollingScheduler& clear_completed() override;

        [[nodiscard]] std::size_t count_pending() const override;
        [[nodiscard]] std::size_t count_active() const override;
        [[nodiscard]] std::size_t count_completed(bool use_counter = true) const override;

       private:
        void admit(http::client::ITransferMultiplexer& transport);
        void refill(http::client::ITransferMultiplexer& transport);
        void complete(http::client::ITransferMultiplexer& transport, http::client::Completion completion);
        void finish(const RequestPtr& request, http::model::Response response);
        void requeue_active();

        std::size_t window_;
        std::chrono::milliseconds wait_timeout_;
        Callback callback_;
        http::model::TransferOptions base_options_;
        http::model::Headers default_headers_;
        MultiplexerFactory multiplexer_factory_;

        std::deque<RequestPtr> pending_;
        std::map<http::client::TransferHandle, RequestPtr> active_;
        std::vector<RequestPtr> completed_;
        std::size_t completed_count_ = 0;
    };
}  // namespace rolling

#endif
