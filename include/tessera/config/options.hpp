#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace tessera::config {

/**
 * Strips the short alias from an option declaration, "log-level,l" is looked
 * up as "log-level".
 */
inline std::string option_name( std::string_view key )
{
  return std::string( key.substr( 0, key.find( ',' ) ) );
}

/**
 * Resolve an option from the command line, then the service section of the
 * configuration file, then its global section, falling back to the default.
 */
template< typename T >
T get_option( std::string_view key,
              T default_value,
              const boost::program_options::variables_map& cli_args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  auto name = option_name( key );

  if( cli_args.count( name ) )
    return cli_args[ name ].as< T >();

  if( service_config && service_config[ name ] )
    return service_config[ name ].as< T >();

  if( global_config && global_config[ name ] )
    return global_config[ name ].as< T >();

  return default_value;
}

/**
 * Resolve a repeatable option. The first source defining it wins, values are
 * never merged across sources.
 */
template< typename T >
std::vector< T > get_options( std::string_view key,
                              const boost::program_options::variables_map& cli_args,
                              const YAML::Node& service_config = YAML::Node(),
                              const YAML::Node& global_config  = YAML::Node() )
{
  return get_option< std::vector< T > >( key, {}, cli_args, service_config, global_config );
}

} // namespace tessera::config
