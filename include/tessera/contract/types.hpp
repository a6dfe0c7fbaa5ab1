#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tessera/encode/big_integer.hpp>

namespace tessera::contract {

using encode::big_integer;

// Addresses and arguments are raw byte strings.
using address = std::string;

inline constexpr std::string_view init_function_name = "_init";

struct call_input
{
  std::string function;
  address caller;
  address recipient;
  big_integer call_value;
  std::uint64_t gas_provided = 0;
  std::vector< std::string > arguments;
};

struct gas_cost
{
  std::uint64_t esdt_issue         = 0;
  std::uint64_t esdt_operations    = 0;
  std::uint64_t data_copy_per_byte = 0;
};

} // namespace tessera::contract
