#pragma once
#include <sidecar/types/basetypes.hpp>

namespace sidecar::types {

/**
 * A validator's signature over a block hash, attesting the block is final in the given era.
 */
struct finality_signature
{
   block_hash_type    block_hash;
   era_id_type        era_id;
   crypto::signature  signature;
   crypto::public_key public_key;

   bool operator==( const finality_signature& other ) const;
   bool operator!=( const finality_signature& other ) const;
};

void to_json( json& j, const finality_signature& s );
void from_json( const json& j, finality_signature& s );

} // sidecar::types
