//
// Created by rolling-fetch maintainers on 10/18/26.
//

#include "response_store.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace http::store {

    ResponseStore::ResponseStore(std::filesystem::path root) : root_(std::move(root)) { std::filesystem::create_directories(root_); }

    std::filesystem::path ResponseStore::save(const http::model::Request &request) const {
        if (!request.response_) {
            throw std::logic_error("Cannot store a request that has not completed: " + request.url_);
        }

        const auto base_path = base_path_for(request);
        write_atomic(string_utils::append_to_path(base_path, constants::BODY_FILE_EXT), request.response_->body_);
        save_meta_atomic(string_utils::append_to_path(base_path, constants::META_FILE_EXT), request);
        return base_path;
    }

    std::filesystem::path ResponseStore::base_path_for(const http::model::Request &request) const {
        std::hash<std::string> hash_maker;
        // Method is part of the key so a GET and a POST to one URL do not overwrite each other.
        const size_t hash = hash_maker(std::string(http::model::to_string(request.method_)) + " " + request.url_);
        return root_ / std::to_string(hash);
    }

    void ResponseStore::save_meta_atomic(const std::filesystem::path &p, const http::model::Request &request) {
        const http::model::Response &r = *request.response_;
        std::ostringstream oss;
        oss << "method: " << http::model::to_string(request.method_) << "\n"
            << "url: " << request.url_ << "\n"
            << "status: " << r.info_.status_ << "\n"
            << "effective_url: " << r.info_.effective_url_ << "\n"
            << "content_type: " << r.info_.content_type_ << "\n"
            << "redirect_count: " << r.info_.redirect_count_ << "\n"
            << "size_download: " << r.info_.size_download_ << "\n"
            << "total_time_s: " << r.info_.total_time_s_ << "\n"
            << "error_code: " << r.error_code_ << "\n"
            << "error_message: " << r.error_message_ << "\n";
        write_atomic(p, oss.str());
    }

    void ResponseStore::write_atomic(const std::filesystem::path &p, std::string_view bytes) {
        auto tmp = p;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("open failed: " + tmp.string());
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                throw std::runtime_error("write failed: " + tmp.string());
            }
        }
        std::filesystem::rename(tmp, p);  // atomic on same filesystem
    }
}  // namespace http::store
