#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tessera/encode/error.hpp>

namespace tessera::encode {

std::string to_hex( std::span< const std::byte > s, bool prefixed = true ) noexcept;
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

} // namespace tessera::encode
