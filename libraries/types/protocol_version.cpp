#include <sidecar/types/exceptions.hpp>
#include <sidecar/types/protocol_version.hpp>

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <tuple>
#include <vector>

namespace sidecar::types {

bool protocol_version_type::operator==( const protocol_version_type& other ) const
{
   return std::tie( major_version, minor_version, patch_version ) == std::tie( other.major_version, other.minor_version, other.patch_version );
}

bool protocol_version_type::operator!=( const protocol_version_type& other ) const
{
   return !( *this == other );
}

bool protocol_version_type::operator<( const protocol_version_type& other ) const
{
   return std::tie( major_version, minor_version, patch_version ) < std::tie( other.major_version, other.minor_version, other.patch_version );
}

std::string to_string( const protocol_version_type& v )
{
   return std::to_string( v.major_version ) + "." + std::to_string( v.minor_version ) + "." + std::to_string( v.patch_version );
}

protocol_version_type protocol_version_from_string( const std::string& s )
{
   std::vector< std::string > parts;
   boost::split( parts, s, boost::is_any_of( "." ) );

   SIDECAR_ASSERT( parts.size() == 3, invalid_protocol_version,
      "protocol version '${s}' must have three components", ("s", s) );

   std::vector< uint32_t > numbers;
   for ( const auto& part : parts )
   {
      bool numeric = !part.empty() && part.size() <= 10
         && std::all_of( part.begin(), part.end(), []( char c ) { return std::isdigit( static_cast< unsigned char >( c ) ); } );
      SIDECAR_ASSERT( numeric, invalid_protocol_version, "protocol version '${s}' has a non numeric component", ("s", s) );

      auto value = std::stoull( part );
      SIDECAR_ASSERT( value <= std::numeric_limits< uint32_t >::max(), invalid_protocol_version,
         "protocol version '${s}' has a component that is out of range", ("s", s) );

      numbers.push_back( static_cast< uint32_t >( value ) );
   }

   protocol_version_type v;
   v.major_version = numbers[0];
   v.minor_version = numbers[1];
   v.patch_version = numbers[2];
   return v;
}

std::ostream& operator<<( std::ostream& os, const protocol_version_type& v )
{
   return os << to_string( v );
}

void to_json( json& j, const protocol_version_type& v )
{
   j = to_string( v );
}

void from_json( const json& j, protocol_version_type& v )
{
   v = protocol_version_from_string( j.get< std::string >() );
}

} // sidecar::types
