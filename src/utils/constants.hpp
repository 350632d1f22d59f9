#ifndef ROLLING_FETCH_CONSTANTS_HPP
#define ROLLING_FETCH_CONSTANTS_HPP

#include <cstddef>

namespace constants {
    inline constexpr std::size_t DEFAULT_WINDOW = 5;
    inline constexpr std::size_t MIN_WINDOW = 2;
    inline constexpr long DEFAULT_WAIT_TIMEOUT_MS = 10'000L;
    inline constexpr const char* BODY_FILE_EXT = ".body";
    inline constexpr const char* META_FILE_EXT = ".meta";
}  // namespace constants

#endif
