//
// Created by rolling-fetch maintainers on 10/18/26.
//

#include "job_file.hpp"

#include <simdjson.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

#include "../utils/string_utils.hpp"

using namespace simdjson;

namespace config {

    ConfigError::ConfigError(std::string field, const std::string& msg)
        : std::runtime_error(field.empty() ? msg : field + ": " + msg), field_(std::move(field)) {}

    namespace parser {
        constexpr std::array<std::pair<std::string_view, http::model::HttpVersion>, 6> HTTP_VERSIONS = {{
            {"default", http::model::HttpVersion::DEFAULT},
            {"1.0", http::model::HttpVersion::HTTP_1_0},
            {"1.1", http::model::HttpVersion::HTTP_1_1},
            {"2", http::model::HttpVersion::HTTP_2},
            {"2tls", http::model::HttpVersion::HTTP_2_TLS},
            {"3", http::model::HttpVersion::HTTP_3},
        }};

        std::string child(const std::string& parent, std::string_view key) { return parent.empty() ? std::string(key) : parent + "." + std::string(key); }

        std::string child(const std::string& parent, size_t index) { return parent + "[" + std::to_string(index) + "]"; }

        bool read_bool(ondemand::value& value, const std::string& field) {
            bool out = false;
            if (value.get_bool().get(out) != SUCCESS) {
                throw ConfigError(field, "expected a boolean");
            }
            return out;
        }

        long read_non_negative(ondemand::value& value, const std::string& field) {
            int64_t out = 0;
            if (value.get_int64().get(out) != SUCCESS) {
                throw ConfigError(field, "expected an integer");
            }
            if (out < 0) {
                throw ConfigError(field, "must not be negative");
            }
            return static_cast<long>(out);
        }

        std::string read_string(ondemand::value& value, const std::string& field) {
            std::string_view out;
            if (value.get_string().get(out) != SUCCESS) {
                throw ConfigError(field, "expected a string");
            }
            return std::string(out);
        }

        ondemand::object read_object(ondemand::value& value, const std::string& field) {
            ondemand::object out;
            if (value.get_object().get(out) != SUCCESS) {
                throw ConfigError(field, "expected an object");
            }
            return out;
        }

        ondemand::array read_array(ondemand::value& value, const std::string& field) {
            ondemand::array out;
            if (value.get_array().get(out) != SUCCESS) {
                throw ConfigError(field, "expected an array");
            }
            return out;
        }

        // Calls fn(key, value) for every member of the object at `value`.
        template <typename Fn>
        void for_each_field(ondemand::value& value, const std::string& field, Fn&& fn) {
            ondemand::object object = read_object(value, field);
            for (auto member : object) {
                ondemand::field f;
                std::string_view key;
                if (std::move(member).get(f) != SUCCESS || f.unescaped_key().get(key) != SUCCESS) {
                    throw ConfigError(field, "malformed member");
                }
                fn(key, f.value());
            }
        }

        template <typename Fn>
        void for_each_item(ondemand::value& value, const std::string& field, Fn&& fn) {
            ondemand::array array = read_array(value, field);
            size_t index = 0;
            for (auto item : array) {
                ondemand::value v;
                if (item.get(v) != SUCCESS) {
                    throw ConfigError(child(field, index), "malformed item");
                }
                fn(v, child(field, index));
                ++index;
            }
        }

        http::model::Headers parse_headers(ondemand::value& value, const std::string& field) {
            ondemand::json_type type;
            if (value.type().get(type) != SUCCESS) {
                throw ConfigError(field, "malformed value");
            }

            http::model::Headers out;
            if (type == ondemand::json_type::object) {
                for_each_field(value, field, [&](std::string_view name, ondemand::value& v) {
                    out.push_back(std::string(name) + ": " + read_string(v, child(field, name)));
                });
                return out;
            }

            for_each_item(value, field, [&](ondemand::value& v, const std::string& item_field) {
                std::string line = read_string(v, item_field);
                if (line.find(':') == std::string::npos || string_utils::split_header_line(line).first.empty()) {
                    throw ConfigError(item_field, "header has no name: " + line);
                }
                out.push_back(std::move(line));
            });
            return out;
        }

        http::model::HttpVersion parse_http_version(ondemand::value& value, const std::string& field) {
            const std::string name = read_string(value, field);
            for (const auto& [known, version] : HTTP_VERSIONS) {
                if (string_utils::ieq(name, known)) {
                    return version;
                }
            }
            throw ConfigError(field, "unknown http version: " + name);
        }

        http::model::TransferOptions parse_options(ondemand::value& value, const std::string& field) {
            http::model::TransferOptions out;

            for_each_field(value, field, [&](std::string_view key, ondemand::value& v) {
                const std::string name = child(field, key);
                if (key == "follow_location") {
                    out.follow_location_ = read_bool(v, name);
                } else if (key == "max_redirects") {
                    out.max_redirects_ = read_non_negative(v, name);
                } else if (key == "connect_timeout_ms") {
                    out.connect_timeout_ = std::chrono::milliseconds{read_non_negative(v, name)};
                } else if (key == "timeout_ms") {
                    out.timeout_ = std::chrono::milliseconds{read_non_negative(v, name)};
                } else if (key == "user_agent") {
                    out.user_agent_ = read_string(v, name);
                } else if (key == "accept_encoding") {
                    out.accept_encoding_ = read_string(v, name);
                } else if (key == "http_version") {
                    out.http_version_ = parse_http_version(v, name);
                } else if (key == "verify_peer") {
                    out.verify_peer_ = read_bool(v, name);
                } else if (key == "verify_host") {
                    out.verify_host_ = read_bool(v, name);
                } else if (key == "proxy") {
                    out.proxy_ = read_string(v, name);
                } else if (key == "verbose") {
                    out.verbose_ = read_bool(v, name);
                } else if (key == "tcp_keepalive") {
                    out.tcp_keepalive_ = read_bool(v, name);
                } else if (key == "low_speed_limit") {
                    out.low_speed_limit_ = read_non_negative(v, name);
                } else if (key == "low_speed_time_s") {
                    out.low_speed_time_ = std::chrono::seconds{read_non_negative(v, name)};
                } else if (key == "cookie") {
                    out.cookie_ = read_string(v, name);
                } else if (key == "referer") {
                    out.referer_ = read_string(v, name);
                } else {
                    throw ConfigError(name, "unknown option");
                }
            });
            return out;
        }

        http::model::FormFields parse_form(ondemand::value& value, const std::string& field) {
            http::model::FormFields out;
            for_each_field(value, field, [&](std::string_view key, ondemand::value& v) { out.emplace_back(std::string(key), read_string(v, child(field, key))); });
            return out;
        }

        http::model::Request parse_request(ondemand::value& value, const std::string& field) {
            http::model::Request out;
            bool has_raw_body = false;
            bool has_form = false;

            for_each_field(value, field, [&](std::string_view key, ondemand::value& v) {
                const std::string name = child(field, key);
                if (key == "url") {
                    out.url_ = read_string(v, name);
                } else if (key == "method") {
                    const std::string method = read_string(v, name);
                    const auto parsed = http::model::method_from_string(method);
                    if (!parsed) {
                        throw ConfigError(name, "unsupported method: " + method);
                    }
                    out.method_ = *parsed;
                } else if (key == "body") {
                    out.body_ = read_string(v, name);
                    has_raw_body = true;
                } else if (key == "form") {
                    out.body_ = parse_form(v, name);
                    has_form = true;
                } else if (key == "headers") {
                    out.headers_ = parse_headers(v, name);
                } else if (key == "options") {
                    out.options_ = parse_options(v, name);
                } else if (key == "tag") {
                    out.extra_info_ = read_string(v, name);
                } else {
                    throw ConfigError(name, "unknown request field");
                }
            });

            if (out.url_.empty()) {
                throw ConfigError(child(field, "url"), "is required");
            }
            if (has_raw_body && has_form) {
                throw ConfigError(field, "body and form are mutually exclusive");
            }
            return out;
        }
    }  // namespace parser

    JobFile JobFile::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw ConfigError("", "Job file not found: " + path.string());
        }

        padded_string json;
        if (padded_string::load(path.string()).get(json) != SUCCESS) {
            throw ConfigError("", "Could not read job file: " + path.string());
        }
        return parse_json(json);
    }

    JobFile JobFile::parse_json(std::string_view json) {
        JobFile job;
        bool has_requests = false;

        const padded_string padded(json);
        ondemand::parser json_parser;
        ondemand::document doc;
        if (json_parser.iterate(padded).get(doc) != SUCCESS) {
            throw ConfigError("", "Job file is not valid JSON");
        }

        ondemand::object root;
        if (doc.get_object().get(root) != SUCCESS) {
            throw ConfigError("", "Job file must contain a JSON object");
        }

        for (auto member : root) {
            ondemand::field f;
            std::string_view key;
            if (std::move(member).get(f) != SUCCESS || f.unescaped_key().get(key) != SUCCESS) {
                throw ConfigError("", "Job file is not valid JSON");
            }
            ondemand::value& v = f.value();
            const std::string name(key);

            if (key == "window") {
                job.window_ = parser::read_non_negative(v, name);
            } else if (key == "wait_timeout_ms") {
                job.wait_timeout_ = std::chrono::milliseconds{parser::read_non_negative(v, name)};
            } else if (key == "verbose") {
                job.verbose_ = parser::read_bool(v, name);
            } else if (key == "output_dir") {
                job.output_dir_ = std::filesystem::path(parser::read_string(v, name));
            } else if (key == "headers") {
                job.headers_ = parser::parse_headers(v, name);
            } else if (key == "options") {
                job.options_ = parser::parse_options(v, name);
            } else if (key == "requests") {
                parser::for_each_item(v, name, [&](ondemand::value& item, const std::string& item_field) {
                    job.requests_.push_back(parser::parse_request(item, item_field));
                });
                has_requests = true;
            } else {
                throw ConfigError(name, "unknown field");
            }
        }

        if (!has_requests) {
            throw ConfigError("requests", "is required");
        }
        if (job.verbose_) {
            job.options_.verbose_ = true;
        }
        return job;
    }

}  // namespace config
