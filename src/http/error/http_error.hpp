//
// Created by rolling-fetch maintainers on 10/18/26.
//

#ifndef ROLLING_FETCH_HTTP_ERROR_HPP
#define ROLLING_FETCH_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    // A multiplexer-level failure. Unlike a failed transfer, this ends the whole run.
    struct TransportError : public std::runtime_error {
        int code_;
        std::string operation_;
        explicit TransportError(int code, std::string operation, const std::string &msg);
    };

    // One transfer could not be set up. Only that request fails; the run goes on.
    struct SubmitError : public std::runtime_error {
        int code_;
        explicit SubmitError(int code, const std::string &msg);
    };
}  // namespace http::http_error

#endif
