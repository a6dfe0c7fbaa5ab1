#pragma once

#include <chrono>
#include <iomanip>
#include <span>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <tessera/encode.hpp>

namespace tessera::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

struct duration
{
  std::chrono::system_clock::duration value;
};

template< typename T1, typename T2 >
  requires std::is_integral_v< T1 > && std::is_integral_v< T2 >
struct percent
{
  T1 numerator;
  T2 denominator;
};

} // namespace tessera::log

template<>
struct fmtquill::formatter< tessera::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                tessera::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< tessera::log::hex >: quill::BinaryDataDeferredFormatCodec< tessera::log::hex >
{};

template<>
struct fmtquill::formatter< tessera::log::duration >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::log::duration& d, format_context& ctx ) const
  {
    auto time = std::chrono::duration_cast< std::chrono::seconds >( d.value ).count();

    if( time < 0 )
      time = 0;

    constexpr auto seconds_per_minute = 60;
    constexpr auto minutes_per_hour   = 60;
    constexpr auto hours_per_day      = 24;

    auto seconds  = time % seconds_per_minute;
    time         /= seconds_per_minute;
    auto minutes  = time % minutes_per_hour;
    time         /= minutes_per_hour;
    auto hours    = time % hours_per_day;
    auto days     = time / hours_per_day;

    std::stringstream ss;

    if( days )
      ss << days << "d, ";

    ss << std::setw( 2 ) << std::setfill( '0' ) << hours;
    ss << std::setw( 1 ) << "h, ";
    ss << std::setw( 2 ) << std::setfill( '0' ) << minutes;
    ss << std::setw( 1 ) << "m, ";
    ss << std::setw( 2 ) << std::setfill( '0' ) << seconds;
    ss << std::setw( 1 ) << "s";

    return fmtquill::format_to( ctx.out(), "{}", ss.str() );
  }
};

template<>
struct quill::Codec< tessera::log::duration >: quill::DeferredFormatCodec< tessera::log::duration >
{};

template< typename T1, typename T2 >
struct fmtquill::formatter< tessera::log::percent< T1, T2 > >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::log::percent< T1, T2 >& p, format_context& ctx ) const
  {
    static constexpr auto one_hundred_percent = 100;

    if( !p.denominator )
      throw std::runtime_error( "percent formatter divide by zero" );

    auto percent = static_cast< double >( p.numerator ) / static_cast< double >( p.denominator ) * one_hundred_percent;
    return fmtquill::format_to( ctx.out(), "{:.2f}%", percent );
  }
};

template< typename T1, typename T2 >
struct quill::Codec< tessera::log::percent< T1, T2 > >: quill::DeferredFormatCodec< tessera::log::percent< T1, T2 > >
{};
