#pragma once

#include <tessera/contract/error.hpp>
#include <tessera/contract/types.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tessera::vm {

using contract::address;
using contract::big_integer;

struct output_transfer
{
  address sender;
  address destination;
  big_integer value;
  std::vector< std::byte > data;
  std::uint64_t gas_limit = 0;
};

struct global_setting
{
  address sender;
  std::vector< std::byte > data;
};

struct vm_output
{
  contract::return_code code = contract::return_code::ok;
  std::string return_message;
  std::vector< std::vector< std::byte > > return_data;
  std::uint64_t gas_remaining = 0;
  std::vector< output_transfer > transfers;
  std::vector< global_setting > global_settings;
};

} // namespace tessera::vm
