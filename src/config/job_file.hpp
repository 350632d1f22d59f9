//
// Created by rolling-fetch maintainers on 10/18/26.
//

#ifndef ROLLING_FETCH_CONFIG_JOB_FILE_HPP
#define ROLLING_FETCH_CONFIG_JOB_FILE_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../http/model/model.hpp"
#include "../utils/constants.hpp"

namespace config {

    struct ConfigError : public std::runtime_error {
        std::string field_;
        explicit ConfigError(std::string field, const std::string& msg);
    };

    // See: jobs/example.json for a complete file.
    struct JobFile {
        long window_ = static_cast<long>(constants::DEFAULT_WINDOW);
        std::chrono::milliseconds wait_timeout_{constants::DEFAULT_WAIT_TIMEOUT_MS};
        bool verbose_ = false;
        std::optional<std::filesystem::path> output_dir_;
        http::model::Headers headers_;
        http::model::TransferOptions options_;
        std::vector<http::model::Request> requests_;

        [[nodiscard]] static JobFile load_from_file(const std::filesystem::path& path);
        [[nodiscard]] static JobFile parse_json(std::string_view json);
    };

}  // namespace config

#endif
