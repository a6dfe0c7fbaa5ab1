#include <tessera/contract/esdt_state.hpp>
#include <tessera/memory.hpp>

#include <sstream>
#include <stdexcept>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

namespace tessera::contract {

namespace {

template< typename T >
std::vector< std::byte > to_bytes( const T& t )
{
  std::stringstream stream;

  {
    boost::archive::binary_oarchive archive( stream, boost::archive::no_header );
    archive << t;
  }

  return memory::to_vector( stream.view() );
}

template< typename T >
result< T > from_bytes( std::span< const std::byte > bytes )
{
  if( bytes.empty() )
    return std::unexpected( contract_errc::malformed_record );

  std::stringstream stream{ std::string( memory::as_string_view( bytes ) ) };
  T t;

  try
  {
    boost::archive::binary_iarchive archive( stream, boost::archive::no_header );
    archive >> t;
  }
  catch( const boost::archive::archive_exception& )
  {
    return std::unexpected( contract_errc::malformed_record );
  }
  catch( const std::exception& )
  {
    // Corrupted length prefix or number
    return std::unexpected( contract_errc::malformed_record );
  }

  return t;
}

} // namespace

std::vector< std::byte > marshal( const token_data& token )
{
  return to_bytes( token );
}

std::vector< std::byte > marshal( const esdt_config& config )
{
  return to_bytes( config );
}

result< token_data > unmarshal_token( std::span< const std::byte > bytes )
{
  return from_bytes< token_data >( bytes );
}

result< esdt_config > unmarshal_config( std::span< const std::byte > bytes )
{
  return from_bytes< esdt_config >( bytes );
}

} // namespace tessera::contract
