#pragma once

#include <sidecar/crypto/digest.hpp>
#include <sidecar/crypto/public_key.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/serialization/strong_typedef.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sidecar::types {

   using json = nlohmann::json;

   typedef boost::multiprecision::uint512_t uint512_t;

   using variable_blob = std::vector< char >;

   BOOST_STRONG_TYPEDEF( uint64_t, era_id_type );
   BOOST_STRONG_TYPEDEF( uint64_t, timestamp_type );  //< Milliseconds since the Unix epoch
   BOOST_STRONG_TYPEDEF( uint64_t, time_diff_type );  //< Milliseconds

   BOOST_STRONG_TYPEDEF( crypto::digest, block_hash_type );
   BOOST_STRONG_TYPEDEF( crypto::digest, deploy_hash_type );

   void to_json( json& j, const era_id_type& e );
   void from_json( const json& j, era_id_type& e );

   void to_json( json& j, const block_hash_type& h );
   void from_json( const json& j, block_hash_type& h );

   void to_json( json& j, const deploy_hash_type& h );
   void from_json( const json& j, deploy_hash_type& h );

   /**
    * Strict numeric reads. Floats, negative values and values outside the
    * target range throw invalid_number instead of being truncated or wrapped.
    */
   uint64_t uint64_from_json( const json& j );
   int32_t int32_from_json( const json& j );

   std::string to_string( const uint512_t& v );
   uint512_t uint512_from_string( const std::string& s );

} // sidecar::types
