#pragma once

#include <expected>
#include <system_error>

namespace tessera::heartbeat {

enum class heartbeat_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_threshold,
  missing_clock
};

const std::error_category& heartbeat_category() noexcept;

std::error_code make_error_code( heartbeat_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::heartbeat

template<>
struct std::is_error_code_enum< tessera::heartbeat::heartbeat_errc >: public std::true_type
{};
