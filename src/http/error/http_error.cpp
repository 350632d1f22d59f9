//
// Created by rolling-fetch maintainers on 10/18/26.
//

#include "http_error.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace http::http_error {
    TransportError::TransportError(int code,
                                   std::string operation,  // NOLINT(bugprone-easily-swappable-parameters)
                                   const std::string &msg)
        : std::runtime_error(operation + " failed (" + std::to_string(code) + "): " + msg), code_(code), operation_(std::move(operation)) {}

    SubmitError::SubmitError(int code, const std::string &msg) : std::runtime_error(msg), code_(code) {}
};  // namespace http::http_error
