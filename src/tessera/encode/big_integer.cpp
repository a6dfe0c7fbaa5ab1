#include <tessera/encode/big_integer.hpp>
#include <tessera/memory.hpp>

#include <algorithm>
#include <iterator>
#include <string>

namespace tessera::encode {

big_integer to_big_integer( std::span< const std::byte > bytes )
{
  big_integer value;

  if( bytes.empty() )
    return value;

  const auto* first = memory::pointer_cast< const unsigned char* >( bytes.data() );
  boost::multiprecision::import_bits( value, first, first + bytes.size(), 8, true );

  return value;
}

result< std::vector< std::byte > > from_big_integer( const big_integer& value )
{
  if( value < 0 )
    return std::unexpected( encode_errc::negative_number );

  if( value == 0 )
    return std::vector< std::byte >{};

  std::vector< unsigned char > raw;
  boost::multiprecision::export_bits( value, std::back_inserter( raw ), 8, true );

  std::vector< std::byte > bytes( raw.size() );
  std::ranges::transform( raw,
                          bytes.begin(),
                          []( unsigned char c )
                          {
                            return static_cast< std::byte >( c );
                          } );
  return bytes;
}

result< big_integer > parse_decimal( std::string_view sv )
{
  bool negative = false;

  if( sv.starts_with( '-' ) )
  {
    negative = true;
    sv.remove_prefix( 1 );
  }

  if( sv.empty() )
    return std::unexpected( encode_errc::invalid_number );

  if( !std::ranges::all_of( sv,
                            []( char c )
                            {
                              return c >= '0' && c <= '9';
                            } ) )
    return std::unexpected( encode_errc::invalid_character );

  // A leading zero would select the octal parser
  auto first_digit = sv.find_first_not_of( '0' );
  if( first_digit == std::string_view::npos )
    return big_integer{ 0 };

  big_integer value( std::string( sv.substr( first_digit ) ) );

  if( negative )
    value = -value;

  return value;
}

} // namespace tessera::encode
