#include <sidecar/types/basetypes.hpp>
#include <sidecar/types/exceptions.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace sidecar::types {

void to_json( json& j, const era_id_type& e )
{
   j = e.t;
}

void from_json( const json& j, era_id_type& e )
{
   e = era_id_type( uint64_from_json( j ) );
}

void to_json( json& j, const block_hash_type& h )
{
   j = h.t.to_hex();
}

void from_json( const json& j, block_hash_type& h )
{
   h = block_hash_type( crypto::digest::from_hex( j.get< std::string >() ) );
}

void to_json( json& j, const deploy_hash_type& h )
{
   j = h.t.to_hex();
}

void from_json( const json& j, deploy_hash_type& h )
{
   h = deploy_hash_type( crypto::digest::from_hex( j.get< std::string >() ) );
}

uint64_t uint64_from_json( const json& j )
{
   if ( j.is_number_unsigned() )
      return j.get< uint64_t >();

   SIDECAR_ASSERT( j.is_number_integer(), invalid_number, "expected an unsigned integer, found ${j}", ("j", j.dump()) );

   auto value = j.get< int64_t >();
   SIDECAR_ASSERT( value >= 0, invalid_number, "expected an unsigned integer, found ${j}", ("j", j.dump()) );
   return static_cast< uint64_t >( value );
}

int32_t int32_from_json( const json& j )
{
   SIDECAR_ASSERT( j.is_number_integer(), invalid_number, "expected a 32 bit integer, found ${j}", ("j", j.dump()) );

   if ( j.is_number_unsigned() )
   {
      auto value = j.get< uint64_t >();
      SIDECAR_ASSERT( value <= uint64_t( std::numeric_limits< int32_t >::max() ), invalid_number,
         "${j} does not fit in a 32 bit integer", ("j", j.dump()) );
      return static_cast< int32_t >( value );
   }

   auto value = j.get< int64_t >();
   SIDECAR_ASSERT( value >= std::numeric_limits< int32_t >::min() && value <= std::numeric_limits< int32_t >::max(),
      invalid_number, "${j} does not fit in a 32 bit integer", ("j", j.dump()) );
   return static_cast< int32_t >( value );
}

std::string to_string( const uint512_t& v )
{
   return v.str();
}

uint512_t uint512_from_string( const std::string& s )
{
   bool decimal = !s.empty() && std::all_of( s.begin(), s.end(), []( char c ) { return std::isdigit( static_cast< unsigned char >( c ) ); } );
   SIDECAR_ASSERT( decimal, invalid_amount, "amount '${s}' is not a decimal integer", ("s", s) );

   // A leading zero would select octal parsing
   auto digits = s.substr( std::min( s.find_first_not_of( '0' ), s.size() - 1 ) );
   boost::multiprecision::cpp_int value( digits );

   SIDECAR_ASSERT( value <= boost::multiprecision::cpp_int( std::numeric_limits< uint512_t >::max() ),
      invalid_amount, "amount '${s}' does not fit in 512 bits", ("s", s) );

   return uint512_t( value );
}

} // sidecar::types
