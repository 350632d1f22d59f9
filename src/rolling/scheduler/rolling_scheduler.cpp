//
// Created by rolling-fetch maintainers on 10/18/26.
//

#include "rolling_scheduler.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include "../../http/client/curl_multi.hpp"
#include "../../http/error/http_error.hpp"
#include "../../utils/constants.hpp"

namespace rolling {

    RollingScheduler::RollingScheduler() : RollingScheduler([]() { return std::make_unique<http::client::CurlMulti>(); }) {}

    RollingScheduler::RollingScheduler(MultiplexerFactory multiplexer_factory)
        : window_(constants::DEFAULT_WINDOW),
          wait_timeout_(constants::DEFAULT_WAIT_TIMEOUT_MS),
          multiplexer_factory_(std::move(multiplexer_factory)) {
        if (multiplexer_factory_ == nullptr) {
            throw std::invalid_argument("Multiplexer factory is required");
        }
    }

    //
    // Admission
    //

    RollingScheduler& RollingScheduler::add(RequestPtr request) {
        if (request == nullptr) {
            throw std::invalid_argument("Cannot queue a null request");
        }
        pending_.push_back(std::move(request));
        return *this;
    }

    RollingScheduler& RollingScheduler::add(http::model::Request request) { return add(std::make_shared<http::model::Request>(std::move(request))); }

    RollingScheduler& RollingScheduler::request(std::string url, http::model::Method method, std::optional<http::model::Body> body,
                                                std::optional<http::model::Headers> headers, std::optional<http::model::TransferOptions> options) {
        auto r = std::make_shared<http::model::Request>(std::move(url), method);
        if (body) {
            r->body_ = std::move(*body);
        }
        if (headers) {
            r->headers_ = std::move(*headers);
        }
        if (options) {
            r->options_ = std::move(*options);
        }
        return add(std::move(r));
    }

    RollingScheduler& RollingScheduler::get(std::string url, std::optional<http::model::Headers> headers, std::optional<http::model::TransferOptions> options) {
        return request(std::move(url), http::model::Method::GET, std::nullopt, std::move(headers), std::move(options));
    }

    RollingScheduler& RollingScheduler::post(std::string url, std::optional<http::model::Body> body, std::optional<http::model::Headers> headers,
                                             std::optional<http::model::TransferOptions> options) {
        return request(std::move(url), http::model::Method::POST, std::move(body), std::move(headers), std::move(options));
    }

    RollingScheduler& RollingScheduler::put(std::string url, std::optional<http::model::Body> body, std::optional<http::model::Headers> headers,
                                            std::optional<http::model::TransferOptions> options) {
        return request(std::move(url), http::model::Method::PUT, std::move(body), std::move(headers), std::move(options));
    }

    RollingScheduler& RollingScheduler::del(std::string url, std::optional<http::model::Headers> headers, std::optional<http::model::TransferOptions> options) {
        return request(std::move(url), http::model::Method::DELETE, std::nullopt, std::move(headers), std::move(options));
    }

    //
    // Configuration
    //

    RollingScheduler& RollingScheduler::set_callback(Callback callback) {
        callback_ = std::move(callback);
        return *this;
    }

    RollingScheduler& RollingScheduler::set_window(long count) {
        if (count < static_cast<long>(constants::MIN_WINDOW)) {
            throw std::invalid_argument("Window must be at least " + std::to_string(constants::MIN_WINDOW) + ", got " + std::to_string(count));
        }
        window_ = static_cast<std::size_t>(count);
        return *this;
    }

    RollingScheduler& RollingScheduler::set_wait_timeout(std::chrono::milliseconds timeout) {
        if (timeout.count() < 0) {
            throw std::invalid_argument("Wait timeout must be >= 0 ms, got " + std::to_string(timeout.count()));
        }
        wait_timeout_ = timeout;
        return *this;
    }

    RollingScheduler& RollingScheduler::set_base_options(http::model::TransferOptions options) {
        base_options_ = std::move(options);
        return *this;
    }

    RollingScheduler& RollingScheduler::merge_base_options(const http::model::TransferOptions& options) {
        base_options_ = base_options_.overlay(options);
        return *this;
    }

    RollingScheduler& RollingScheduler::set_default_headers(http::model::Headers headers) {
        default_headers_ = std::move(headers);
        return *this;
    }

    const Callback& RollingScheduler::get_callback() const { return callback_; }

    std::size_t RollingScheduler::get_window() const { return window_; }

    std::chrono::milliseconds RollingScheduler::get_wait_timeout() const { return wait_timeout_; }

    const http::model::TransferOptions& RollingScheduler::get_base_options() const { return base_options_; }

    const http::model::Headers& RollingScheduler::get_default_headers() const { return default_headers_; }

    http::client::PreparedTransfer RollingScheduler::prepare_transfer(const http::model::Request& request) const {
        http::client::PreparedTransfer t;
        t.url_ = request.url_;
        t.method_ = request.method_;
        t.options_ = http::model::TransferOptions::defaults().overlay(base_options_).overlay(request.options_);

        if (request.has_body()) {
            t.body_ = request.body_;
        }

        // Request headers replace the defaults outright.
        t.headers_ = request.headers_.empty() ? default_headers_ : request.headers_;
        return t;
    }

    //
    // Run loop
    //

    void RollingScheduler::run() {
        if (pending_.empty() && active_.empty()) {
            return;
        }

        std::unique_ptr<http::client::ITransferMultiplexer> transport = multiplexer_factory_();
        if (transport == nullptr) {
            throw std::runtime_error("Multiplexer factory returned no transport");
        }

        try {
            refill(*transport);

            while (!active_.empty()) {
                const http::client::MultiStatus status = transport->progress();
                if (!status.ok()) {
                    throw http::http_error::TransportError(status.code_, "progress", status.message_);
                }

                // One tick can finish several transfers; take all of them before waiting again.
                while (std::optional<http::client::Completion> completion = transport->next_completed()) {
                    complete(*transport, std::move(*completion));
                }

                if (!active_.empty()) {
                    const http::client::MultiStatus waited = transport->wait(wait_timeout_);
                    if (!waited.ok()) {
                        throw http::http_error::TransportError(waited.code_, "wait", waited.message_);
                    }
                }
            }
        } catch (...) {
            requeue_active();
            throw;
        }

        transport->close();
    }

    void RollingScheduler::admit(http::client::ITransferMultiplexer& transport) {
        RequestPtr next = pending_.front();
        http::client::TransferHandle handle = 0;

        try {
            handle = transport.submit(prepare_transfer(*next));
        } catch (const http::http_error::SubmitError& e) {
            // The transport refused this one request; it completes with the error and never holds a slot.
            pending_.pop_front();

            http::model::Response rejected;
            rejected.error_code_ = e.code_;
            rejected.error_message_ = e.what();
            finish(next, std::move(rejected));

            if (callback_) {
                callback_(*next, *this);
            }
            return;
        }

        active_.emplace(handle, std::move(next));
        pending_.pop_front();
    }

    void RollingScheduler::refill(http::client::ITransferMultiplexer& transport) {
        while (active_.size() < window_ && !pending_.empty()) {
            admit(transport);
        }
    }

    void RollingScheduler::complete(http::client::ITransferMultiplexer& transport, http::client::Completion completion) {
        auto it = active_.find(completion.handle_);
        if (it == active_.end()) {
            throw std::runtime_error("Transport reported an unknown transfer: " + std::to_string(completion.handle_));
        }

        // Held here so the request outlives a clear_completed() issued from the callback.
        RequestPtr finished = std::move(it->second);
        active_.erase(it);

        finish(finished, std::move(completion.response_));

        // Refill first, then release the finished handle.
        refill(transport);
        transport.remove(completion.handle_);

        if (callback_) {
            callback_(*finished, *this);
            refill(transport);
        }
    }

    void RollingScheduler::finish(const RequestPtr& request, http::model::Response response) {
        request->response_ = std::move(response);
        completed_.push_back(request);
        ++completed_count_;
    }

    void RollingScheduler::requeue_active() {
        // Handles grow with submission order; walking backwards keeps that order at the front.
        for (auto it = active_.rbegin(); it != active_.rend(); ++it) {
            pending_.push_front(std::move(it->second));
        }
        active_.clear();
    }

    //
    // Queue inspection
    //

    std::vector<RequestPtr> RollingScheduler::next_pending_requests(std::size_t limit) {
        const std::size_t n = std::min(limit, pending_.size());
        std::vector<RequestPtr> out(std::make_move_iterator(pending_.begin()), std::make_move_iterator(pending_.begin() + static_cast<std::ptrdiff_t>(n)));
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
        return out;
    }

    RequestPtr RollingScheduler::next_pending_request() {
        std::vector<RequestPtr> next = next_pending_requests(1);
        return next.empty() ? nullptr : std::move(next.front());
    }

    const std::vector<RequestPtr>& RollingScheduler::get_completed_requests() const { return completed_; }

    RollingScheduler& RollingScheduler::clear_completed() {
        completed_.clear();
        completed_.shrink_to_fit();
        return *this;
    }

    std::size_t RollingScheduler::count_pending() const { return pending_.size(); }

    std::size_t RollingScheduler::count_active() const { return active_.size(); }

    std::size_t RollingScheduler::count_completed(bool use_counter) const { return use_counter ? completed_count_ : completed_.size(); }

}  // namespace rolling
