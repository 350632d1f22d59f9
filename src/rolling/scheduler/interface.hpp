#ifndef ROLLING_FETCH_ROLLING_INTERFACE_HPP
#define ROLLING_FETCH_ROLLING_INTERFACE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "../../http/model/model.hpp"

namespace rolling {
    using RequestPtr = std::shared_ptr<http::model::Request>;

    // The part of the scheduler a completion callback is allowed to touch:
    // new work goes in, nothing already admitted can be reached.
    class IRequestQueue {
       public:
        IRequestQueue() = default;
        virtual ~IRequestQueue() = default;
        IRequestQueue(const IRequestQueue&) = delete;
        IRequestQueue& operator=(const IRequestQueue&) = delete;
        IRequestQueue(IRequestQueue&&) = delete;
        IRequestQueue& operator=(IRequestQueue&&) = delete;

        virtual IRequestQueue& add(RequestPtr request) = 0;
        virtual IRequestQueue& request(std::string url, http::model::Method method = http::model::Method::GET,
                                       std::optional<http::model::Body> body = std::nullopt, std::optional<http::model::Headers> headers = std::nullopt,
                                       std::optional<http::model::TransferOptions> options = std::nullopt) = 0;
        virtual IRequestQueue& get(std::string url, std::optional<http::model::Headers> headers = std::nullopt,
                                   std::optional<http::model::TransferOptions> options = std::nullopt) = 0;
        virtual IRequestQueue& post(std::string url, std::optional<http::model::Body> body = std::nullopt,
                                    std::optional<http::model::Headers> headers = std::nullopt,
                                    std::optional<http::model::TransferOptions> options = std::nullopt) = 0;
        virtual IRequestQueue& put(std::string url, std::optional<http::model::Body> body = std::nullopt,
                                   std::optional<http::model::Headers> headers = std::nullopt,
                                   std::optional<http::model::TransferOptions> options = std::nullopt) = 0;
        virtual IRequestQueue& del(std::string url, std::optional<http::model::Headers> headers = std::nullopt,
                                   std::optional<http::model::TransferOptions> options = std::nullopt) = 0;

        virtual IRequestQueue& clear_completed() = 0;

        [[nodiscard]] virtual std::size_t count_pending() const = 0;
        [[nodiscard]] virtual std::size_t count_active() const = 0;
        [[nodiscard]] virtual std::size_t count_completed(bool use_counter = true) const = 0;
    };
}  // namespace rolling

#endif
