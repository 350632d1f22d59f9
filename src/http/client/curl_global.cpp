//
// Created by rolling-fetch maintainers on 10/18/26.
//

#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace http::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (info == nullptr) {
            curl_global_cleanup();
            throw std::runtime_error("curl_version_info returned no data");
        }

        version_ = info->version != nullptr ? info->version : "unknown";
        supports_http2_ = (info->features & CURL_VERSION_HTTP2) != 0;
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace http::client
