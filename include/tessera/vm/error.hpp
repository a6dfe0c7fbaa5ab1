#pragma once

#include <expected>
#include <system_error>

namespace tessera::vm {

enum class vm_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  missing_context,
  insufficient_gas,
  insufficient_funds,
  negative_value,
  unknown_contract,
  already_deployed
};

const std::error_category& vm_category() noexcept;

std::error_code make_error_code( vm_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::vm

template<>
struct std::is_error_code_enum< tessera::vm::vm_errc >: public std::true_type
{};
