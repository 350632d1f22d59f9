#ifndef ROLLING_FETCH_TESTS_FAKE_MULTIPLEXER_HPP
#define ROLLING_FETCH_TESTS_FAKE_MULTIPLEXER_HPP

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../src/http/client/interface.hpp"
#include "../src/http/error/http_error.hpp"
#include "../src/rolling/scheduler/rolling_scheduler.hpp"

namespace fakes {

    // What the scheduler did to the transport, kept outside it so tests can look after run().
    struct TransportLog {
        std::vector<http::client::PreparedTransfer> submitted_;
        std::vector<http::client::TransferHandle> removed_;
        size_t transports_created_ = 0;
        size_t progress_calls_ = 0;
        size_t wait_calls_ = 0;
        size_t close_calls_ = 0;
        size_t max_unfinished_ = 0;
    };

    using Responder = std::function<http::model::Response(const http::client::PreparedTransfer&)>;
    using Rejecter = std::function<bool(const http::client::PreparedTransfer&)>;

    // Same value as CURLE_UNSUPPORTED_PROTOCOL.
    constexpr int REJECTED_CODE = 1;

    inline http::model::Response always_ok(const http::client::PreparedTransfer& transfer) {
        http::model::Response r;
        r.body_ = "ok";
        r.info_.status_ = 200;
        r.info_.effective_url_ = transfer.url_;
        return r;
    }

    // Finishes transfers instantly, oldest first, on each progress() call.
    class FakeMultiplexer : public http::client::ITransferMultiplexer {
       public:
        FakeMultiplexer(std::shared_ptr<TransportLog> log, Responder responder, size_t completions_per_tick, std::optional<size_t> fail_on_progress,
                        std::optional<size_t> fail_on_wait, Rejecter rejecter)
            : log_(std::move(log)),
              responder_(std::move(responder)),
              completions_per_tick_(completions_per_tick),
              fail_on_progress_(fail_on_progress),
              fail_on_wait_(fail_on_wait),
              rejecter_(std::move(rejecter)) {
            ++log_->transports_created_;
        }

        http::client::TransferHandle submit(const http::client::PreparedTransfer& transfer) override {
            if (rejecter_ && rejecter_(transfer)) {
                throw http::http_error::SubmitError(REJECTED_CODE, "simulated submit rejection: " + transfer.url_);
            }
            const http::client::TransferHandle handle = next_handle_++;
            log_->submitted_.push_back(transfer);
            running_.emplace_back(handle, transfer);
            attached_.insert(handle);
            unfinished_.insert(handle);
            log_->max_unfinished_ = std::max(log_->max_unfinished_, unfinished_.size());
            return handle;
        }

        http::client::MultiStatus progress() override {
            ++log_->progress_calls_;
            if (fail_on_progress_ && log_->progress_calls_ == *fail_on_progress_) {
                return http::client::MultiStatus{.code_ = 7, .still_running_ = 0, .message_ = "simulated multiplexer failure"};
            }

            for (size_t n = 0; n < completions_per_tick_ && !running_.empty(); ++n) {
                auto& [handle, transfer] = running_.front();
                ready_.push_back(http::client::Completion{.handle_ = handle, .response_ = responder_(transfer)});
                running_.pop_front();
            }
            return http::client::MultiStatus{.code_ = 0, .still_running_ = static_cast<int>(running_.size()), .message_ = ""};
        }

        std::optional<http::client::Completion> next_completed() override {
            if (ready_.empty()) {
                return std::nullopt;
            }
            http::client::Completion c = std::move(ready_.front());
            ready_.pop_front();
            unfinished_.erase(c.handle_);
            return c;
        }

        void remove(http::client::TransferHandle handle) override {
            if (attached_.erase(handle) == 0) {
                throw std::out_of_range("remove of unknown handle " + std::to_string(handle));
            }
            log_->removed_.push_back(handle);
        }

        http::client::MultiStatus wait(std::chrono::milliseconds) override {
            ++log_->wait_calls_;
            if (fail_on_wait_ && log_->wait_calls_ == *fail_on_wait_) {
                return http::client::MultiStatus{.code_ = 2, .still_running_ = 0, .message_ = "simulated wait failure"};
            }
            return {};
        }

        void close() override { ++log_->close_calls_; }

       private:
        std::shared_ptr<TransportLog> log_;
        Responder responder_;
        size_t completions_per_tick_;
        std::optional<size_t> fail_on_progress_;
        std::optional<size_t> fail_on_wait_;
        Rejecter rejecter_;
        http::client::TransferHandle next_handle_ = 100;
        std::deque<std::pair<http::client::TransferHandle, http::client::PreparedTransfer>> running_;
        std::deque<http::client::Completion> ready_;
        std::set<http::client::TransferHandle> attached_;
        std::set<http::client::TransferHandle> unfinished_;
    };

    inline rolling::MultiplexerFactory fake_factory(const std::shared_ptr<TransportLog>& log, Responder responder = always_ok,
                                                    size_t completions_per_tick = std::numeric_limits<size_t>::max(),
                                                    std::optional<size_t> fail_on_progress = std::nullopt, std::optional<size_t> fail_on_wait = std::nullopt,
                                                    Rejecter rejecter = nullptr) {
        return [=]() { return std::make_unique<FakeMultiplexer>(log, responder, completions_per_tick, fail_on_progress, fail_on_wait, rejecter); };
    }

    inline Rejecter reject_urls_containing(std::string needle) {
        return [needle = std::move(needle)](const http::client::PreparedTransfer& transfer) { return transfer.url_.find(needle) != std::string::npos; };
    }

}  // namespace fakes

#endif
