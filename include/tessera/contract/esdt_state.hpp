#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <boost/serialization/split_member.hpp>
#include <boost/serialization/string.hpp>

#include <tessera/contract/error.hpp>
#include <tessera/contract/types.hpp>

namespace tessera::contract {

struct token_data
{
  address owner_address;
  std::string token_name;
  big_integer minted_value;
  big_integer burnt_value;
  bool burnable         = false;
  bool mintable         = false;
  bool can_pause        = false;
  bool can_freeze       = false;
  bool can_wipe         = false;
  bool can_change_owner = false;
  bool upgradable       = true;
  bool is_paused        = false;

  template< class Archive >
  void save( Archive& ar, const unsigned int version ) const
  {
    std::string minted = minted_value.str();
    std::string burnt  = burnt_value.str();

    ar & owner_address;
    ar & token_name;
    ar & minted;
    ar & burnt;
    ar & burnable;
    ar & mintable;
    ar & can_pause;
    ar & can_freeze;
    ar & can_wipe;
    ar & can_change_owner;
    ar & upgradable;
    ar & is_paused;
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int version )
  {
    std::string minted;
    std::string burnt;

    ar & owner_address;
    ar & token_name;
    ar & minted;
    ar & burnt;
    ar & burnable;
    ar & mintable;
    ar & can_pause;
    ar & can_freeze;
    ar & can_wipe;
    ar & can_change_owner;
    ar & upgradable;
    ar & is_paused;

    minted_value = big_integer( minted );
    burnt_value  = big_integer( burnt );
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

struct esdt_config
{
  address owner_address;
  big_integer base_issuing_cost;
  std::uint32_t min_token_name_length = 0;
  std::uint32_t max_token_name_length = 0;

  template< class Archive >
  void save( Archive& ar, const unsigned int version ) const
  {
    std::string cost = base_issuing_cost.str();

    ar & owner_address;
    ar & cost;
    ar & min_token_name_length;
    ar & max_token_name_length;
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int version )
  {
    std::string cost;

    ar & owner_address;
    ar & cost;
    ar & min_token_name_length;
    ar & max_token_name_length;

    base_issuing_cost = big_integer( cost );
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

std::vector< std::byte > marshal( const token_data& token );
std::vector< std::byte > marshal( const esdt_config& config );

result< token_data > unmarshal_token( std::span< const std::byte > bytes );
result< esdt_config > unmarshal_config( std::span< const std::byte > bytes );

} // namespace tessera::contract
