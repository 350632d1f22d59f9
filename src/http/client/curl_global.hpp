//
// Created by rolling-fetch maintainers on 10/18/26.
//

#ifndef ROLLING_FETCH_CURL_GLOBAL_HPP
#define ROLLING_FETCH_CURL_GLOBAL_HPP

#include <string>

namespace http::client {

    // Process-wide libcurl setup. Create one before any CurlMulti and keep it alive until they are gone.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] const std::string& version() const { return version_; }
        [[nodiscard]] bool supports_http2() const { return supports_http2_; }

       private:
        std::string version_;
        bool supports_http2_ = false;
    };

}  // namespace http::client

#endif
