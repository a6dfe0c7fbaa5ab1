#pragma once

#include <cstdint>
#include <expected>
#include <string_view>
#include <system_error>

namespace tessera::contract {

enum class contract_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  missing_system_interface,
  missing_epoch_notifier,
  invalid_base_issuing_cost,
  invalid_token_name_bounds,
  zero_initial_supply,
  already_registered,
  reserved_token_name,
  not_human_readable,
  invalid_argument,
  invalid_number_of_arguments,
  no_such_token,
  malformed_record
};

const std::error_category& contract_category() noexcept;

std::error_code make_error_code( contract_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

/**
 * Caller visible outcome of a system contract call. The reason for a failure
 * is accumulated as a return message on the system interface.
 */
enum class return_code : std::uint8_t
{
  ok,
  function_not_found,
  function_wrong_signature,
  contract_not_found,
  user_error,
  out_of_gas,
  out_of_funds
};

std::string_view to_string( return_code code ) noexcept;

} // namespace tessera::contract

template<>
struct std::is_error_code_enum< tessera::contract::contract_errc >: public std::true_type
{};
