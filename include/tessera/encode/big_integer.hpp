#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <tessera/encode/error.hpp>

namespace tessera::encode {

using big_integer = boost::multiprecision::cpp_int;

/**
 * Interpret bytes as an unsigned big-endian integer. An empty span is zero.
 */
big_integer to_big_integer( std::span< const std::byte > bytes );

/**
 * Minimal unsigned big-endian encoding of a non-negative integer.
 *
 * Zero encodes to an empty vector. Negative values are rejected.
 */
result< std::vector< std::byte > > from_big_integer( const big_integer& value );

/**
 * Parse a base 10 string. Leading '-' is accepted and yields a negative value.
 */
result< big_integer > parse_decimal( std::string_view sv );

} // namespace tessera::encode
