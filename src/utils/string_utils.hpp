//
// Created by rolling-fetch maintainers on 10/18/26.
//

#ifndef ROLLING_FETCH_STRING_UTILS_HPP
#define ROLLING_FETCH_STRING_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq(std::string_view a, std::string_view b);

    std::string trim(std::string s);

    std::filesystem::path append_to_path(const std::filesystem::path& path, const std::string& str);

    // "Name: value" -> {"Name", "value"}. A line without a colon yields an empty value.
    std::pair<std::string, std::string> split_header_line(std::string_view line);
}  // namespace string_utils

#endif
