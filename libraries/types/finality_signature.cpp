#include <sidecar/types/finality_signature.hpp>

#include <tuple>

namespace sidecar::types {

bool finality_signature::operator==( const finality_signature& other ) const
{
   return std::tie( block_hash, era_id, signature, public_key )
      == std::tie( other.block_hash, other.era_id, other.signature, other.public_key );
}

bool finality_signature::operator!=( const finality_signature& other ) const
{
   return !( *this == other );
}

void to_json( json& j, const finality_signature& s )
{
   j = json {
      { "block_hash", s.block_hash },
      { "era_id",     s.era_id },
      { "signature",  s.signature },
      { "public_key", s.public_key }
   };
}

void from_json( const json& j, finality_signature& s )
{
   j.at( "block_hash" ).get_to( s.block_hash );
   j.at( "era_id" ).get_to( s.era_id );
   j.at( "signature" ).get_to( s.signature );
   j.at( "public_key" ).get_to( s.public_key );
}

} // sidecar::types
