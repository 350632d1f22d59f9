#include <any>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "src/config/job_file.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/store/response_store.hpp"
#include "src/rolling/scheduler/rolling_scheduler.hpp"

namespace {
    void print_completion(const http::model::Request& request) {
        const http::model::Response& r = *request.response_;
        std::cout << std::setw(3) << r.info_.status_ << "  " << std::fixed << std::setprecision(3) << r.info_.total_time_s_ << "s  " << std::setw(9)
                  << r.info_.size_download_ << "B  " << http::model::to_string(request.method_) << " " << request.url_;

        if (const auto* tag = std::any_cast<std::string>(&request.extra_info_)) {
            std::cout << "  [" << *tag << "]";
        }
        std::cout << "\n";
    }
}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <job.json>" << std::endl;
        return 1;
    }

    try {
        config::JobFile job = config::JobFile::load_from_file(argv[1]);

        http::client::CurlGlobal curl_global;

        std::optional<http::store::ResponseStore> store;
        if (job.output_dir_) {
            store.emplace(*job.output_dir_);
        }

        rolling::RollingScheduler scheduler;
        scheduler.set_window(job.window_).set_wait_timeout(job.wait_timeout_).set_default_headers(job.headers_).set_base_options(job.options_);

        size_t failures = 0;
        scheduler.set_callback([&](http::model::Request& request, rolling::IRequestQueue& queue) {
            if (!request.response_->ok()) {
                ++failures;
                std::cerr << "FAILED " << request.url_ << ": " << request.response_->error_message_ << " (curl " << request.response_->error_code_ << ")"
                          << std::endl;
            } else {
                print_completion(request);
                if (store) {
                    store->save(request);
                }
            }
            // Results are consumed here; nothing needs the completed list afterwards.
            queue.clear_completed();
        });

        for (auto& request : job.requests_) {
            scheduler.add(std::move(request));
        }

        if (job.verbose_) {
            std::cout << "libcurl " << curl_global.version() << (curl_global.supports_http2() ? " (http2)" : "") << ", " << scheduler.count_pending()
                      << " requests, window " << scheduler.get_window() << std::endl;
        }

        scheduler.run();

        std::cout << scheduler.count_completed() << " completed, " << failures << " failed" << std::endl;
        return failures == 0 ? 0 : 2;
    } catch (const config::ConfigError& e) {
        std::cerr << "Config Error: " << e.what() << std::endl;
        return 1;
    } catch (const http::http_error::TransportError& e) {
        std::cerr << "Transport Error: " << e.what() << " (operation: " << e.operation_ << ")" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
};
