#pragma once

#include <expected>
#include <string>

namespace dynalias {

template<typename T, typename E = std::string>
using Result = std::expected<T, E>;

} // namespace dynalias
