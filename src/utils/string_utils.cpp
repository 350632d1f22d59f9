//
// Created by rolling-fetch maintainers on 10/18/26.
//

#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::filesystem::path append_to_path(const std::filesystem::path &path, const std::string &str) { return {path.string() + str}; }

    std::pair<std::string, std::string> split_header_line(std::string_view line) {
        const auto pos = line.find(':');
        if (pos == std::string_view::npos) {
            return {trim(std::string(line)), std::string{}};
        }
        return {trim(std::string(line.substr(0, pos))), trim(std::string(line.substr(pos + 1)))};
    }
}  // namespace string_utils
