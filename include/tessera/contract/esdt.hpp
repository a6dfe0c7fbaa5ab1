#pragma once

#include <tessera/contract/epoch_notifier.hpp>
#include <tessera/contract/error.hpp>
#include <tessera/contract/esdt_state.hpp>
#include <tessera/contract/system_contract.hpp>
#include <tessera/contract/system_interface.hpp>
#include <tessera/contract/types.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>

namespace tessera::contract {

struct esdt_settings
{
  address owner_address;
  std::string base_issuing_cost       = "0";
  std::uint32_t min_token_name_length = 3;
  std::uint32_t max_token_name_length = 20;
  std::uint32_t enabled_epoch         = 0;
};

struct esdt_args
{
  std::shared_ptr< system_interface > system;
  gas_cost gas;
  esdt_settings settings;
  address esdt_address;
  std::shared_ptr< epoch_notifier > notifier;
};

/**
 * System contract issuing and managing ESDT tokens.
 *
 * Every token is stored under its name in the contract storage. The contract
 * is disabled until an epoch at or after the configured enabled epoch has been
 * confirmed, only the deployment function is accepted before that.
 *
 * Balance effects of freeze, wipe and pause are never applied here, they are
 * sent to the ledger as built-in function directives.
 */
class esdt final: public system_contract,
                  public epoch_subscriber
{
  struct create_key
  {
    explicit create_key() = default;
  };

public:
  esdt( create_key, const esdt_args& args, const big_integer& base_issuing_cost );
  esdt( const esdt& ) = delete;
  esdt( esdt&& )      = delete;
  ~esdt() override    = default;

  esdt& operator=( const esdt& ) = delete;
  esdt& operator=( esdt&& )      = delete;

  static result< std::shared_ptr< esdt > > create( const esdt_args& args );

  return_code execute( const call_input& input ) override;
  void set_new_gas_cost( const gas_cost& cost ) override;
  void epoch_confirmed( std::uint32_t epoch ) override;

  bool enabled() const noexcept;

  static constexpr std::string_view config_key        = "esdtConfig";
  static constexpr std::string_view issued_tokens_key = "allIssuedTokens";

private:
  enum class function : std::uint8_t
  {
    init,
    issue,
    issue_protected,
    burn,
    mint,
    freeze,
    unfreeze,
    wipe,
    pause,
    unpause,
    claim,
    config_change,
    control_changes,
    transfer_ownership,
    get_all_tokens,
    get_token_properties
  };

  static std::optional< function > lookup( std::string_view name ) noexcept;

  return_code init( const call_input& input );
  return_code issue( const call_input& input );
  return_code issue_protected( const call_input& input );
  return_code burn( const call_input& input );
  return_code mint( const call_input& input );
  return_code toggle_freeze( const call_input& input, std::string_view builtin_function );
  return_code wipe( const call_input& input );
  return_code toggle_pause( const call_input& input, std::string_view builtin_function );
  return_code claim( const call_input& input );
  return_code config_change( const call_input& input );
  return_code control_changes( const call_input& input );
  return_code transfer_ownership( const call_input& input );
  return_code get_all_tokens( const call_input& input );
  return_code get_token_properties( const call_input& input );

  return_code basic_ownership_checks( const call_input& input, token_data& token );

  std::error_code issue_token( std::string_view owner, std::span< const std::string > arguments );
  void add_to_issued_tokens( std::string_view token_name );

  result< token_data > get_existing_token( std::string_view token_name );
  void save_token( const token_data& token );

  esdt_config default_config() const;
  result< esdt_config > get_config();
  void save_config( const esdt_config& config );

  return_code fail( return_code code, std::string_view message );

  std::shared_ptr< system_interface > _system;
  gas_cost _gas_cost;
  const big_integer _base_issuing_cost;
  const address _owner_address;
  const address _esdt_address;
  const std::uint32_t _min_token_name_length;
  const std::uint32_t _max_token_name_length;
  const std::uint32_t _enabled_epoch;
  std::atomic< bool > _enabled = false;
  std::shared_mutex _mutex;
};

bool is_human_readable( std::string_view token_name ) noexcept;

} // namespace tessera::contract
