#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "../src/http/client/curl_global.hpp"

int main(int argc, char* argv[]) {
    http::client::CurlGlobal curl_global;

    return Catch::Session().run(argc, argv);
}
