#include <sidecar/types/cl_value.hpp>

#include <sidecar/util/hex.hpp>

#include <tuple>

namespace sidecar::types {

bool cl_value::operator==( const cl_value& other ) const
{
   return std::tie( cl_type, bytes, parsed ) == std::tie( other.cl_type, other.bytes, other.parsed );
}

bool cl_value::operator!=( const cl_value& other ) const
{
   return !( *this == other );
}

void to_json( json& j, const cl_value& v )
{
   j = json {
      { "cl_type", v.cl_type },
      { "bytes",   util::to_hex( v.bytes ) },
      { "parsed",  v.parsed }
   };
}

void from_json( const json& j, cl_value& v )
{
   v.cl_type = j.at( "cl_type" );
   v.bytes   = util::from_hex( j.at( "bytes" ).get< std::string >() );
   v.parsed  = j.at( "parsed" );
}

} // sidecar::types
