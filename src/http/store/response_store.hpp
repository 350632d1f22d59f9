//
// Created by rolling-fetch maintainers on 10/18/26.
//

#ifndef ROLLING_FETCH_RESPONSE_STORE_HPP
#define ROLLING_FETCH_RESPONSE_STORE_HPP

#include <filesystem>
#include <string_view>

#include "../model/model.hpp"

namespace http::store {
    // Writes completed responses to disk as <root>/<url hash>.body plus a .meta text file.
    class ResponseStore {
       public:
        explicit ResponseStore(std::filesystem::path root);

        ~ResponseStore() = default;
        ResponseStore(const ResponseStore &) = delete;
        ResponseStore &operator=(const ResponseStore &) = delete;
        ResponseStore(ResponseStore &&) = delete;
        ResponseStore &operator=(ResponseStore &&) = delete;

        // Returns the base path (without extension) the two files were written under.
        std::filesystem::path save(const http::model::Request &request) const;

        [[nodiscard]] std::filesystem::path base_path_for(const http::model::Request &request) const;

       private:
        std::filesystem::path root_;

        static void save_meta_atomic(const std::filesystem::path &p, const http::model::Request &request);
        static void write_atomic(const std::filesystem::path &p, std::string_view bytes);
    };
}  // namespace http::store

#endif
