#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace dynalias::constant {

inline constexpr std::string_view EXE_NAME = "dya";
inline constexpr std::string_view APP_NAME = "DYNAMIC ALIAS";
inline constexpr std::string_view PROMPT   = "dya > ";

// Reserved names inside the cache document
inline constexpr std::string_view CACHE_KEY_HISTORY   = "_history";
inline constexpr std::string_view CACHE_KEY_LOCALS    = "_locals";
inline constexpr std::string_view CACHE_KEY_CRYPT     = "_crypt";
inline constexpr std::string_view CACHE_KEY_TIMESTAMP = "timestamp";
inline constexpr std::string_view CACHE_KEY_DATA      = "data";

inline constexpr std::string_view LOCALS_SOURCE = "locals";

inline constexpr std::size_t  DEFAULT_HISTORY_SIZE    = 20;
inline constexpr std::size_t  MAX_HISTORY_SIZE        = 1000;
inline constexpr int          DEFAULT_SOURCE_TIMEOUT  = 10;
inline constexpr std::int64_t DEFAULT_CACHE_TTL       = 300;
inline constexpr int          DEFAULT_SOURCE_PRIORITY = 1;

inline constexpr std::size_t COMMAND_PREVIEW_LENGTH = 100;
inline constexpr std::size_t OUTPUT_PREVIEW_LENGTH  = 200;

inline constexpr int SIGNAL_EXIT_CODE_OFFSET = 128;

} // namespace dynalias::constant
