#ifndef ROLLING_FETCH_CLIENT_INTERFACE_HPP
#define ROLLING_FETCH_CLIENT_INTERFACE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "../model/model.hpp"

namespace http::client {
    // Opaque, comparable id handed out by submit() and consumed by next_completed()/remove().
    using TransferHandle = std::uint64_t;

    // A request with every option layer already resolved.
    struct PreparedTransfer {
        std::string url_;
        http::model::Method method_ = http::model::Method::GET;
        std::optional<http::model::Body> body_;
        http::model::Headers headers_;
        http::model::TransferOptions options_;
    };

    struct Completion {
        TransferHandle handle_{};
        http::model::Response response_;
    };

    struct MultiStatus {
        int code_ = 0;
        int still_running_ = 0;
        std::string message_;

        [[nodiscard]] bool ok() const { return code_ == 0; }
    };

    class ITransferMultiplexer {
       public:
        ITransferMultiplexer() = default;
        virtual ~ITransferMultiplexer() = default;
        ITransferMultiplexer(const ITransferMultiplexer&) = delete;
        ITransferMultiplexer& operator=(const ITransferMultiplexer&) = delete;
        ITransferMultiplexer(ITransferMultiplexer&&) = delete;
        ITransferMultiplexer& operator=(ITransferMultiplexer&&) = delete;

        virtual TransferHandle submit(const PreparedTransfer& transfer) = 0;

        // Non-blocking. A non-ok status is fatal for the run.
        virtual MultiStatus progress() = 0;

        // Each finished transfer is reported exactly once; std::nullopt once nothing else is ready.
        virtual std::optional<Completion> next_completed() = 0;

        virtual void remove(TransferHandle handle) = 0;

        // Blocks until some transfer can progress or `timeout` elapses, whichever comes first.
        virtual MultiStatus wait(std::chrono::milliseconds timeout) = 0;

        virtual void close() = 0;
    };
}  // namespace http::client

#endif
