#pragma once
#include <sidecar/crypto/exceptions.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace sidecar::crypto {

constexpr std::size_t digest_length = 32;

/**
 * A 32 byte hash. The bytes are the canonical form; hex is derived on demand.
 */
struct digest
{
   std::array< char, digest_length > bytes{};

   const char* data() const { return bytes.data(); }
   std::size_t size() const { return bytes.size(); }

   std::string to_hex() const;
   static digest from_hex( const std::string& s );
   static digest from_bytes( const std::vector< char >& b );

   bool operator==( const digest& other ) const { return bytes == other.bytes; }
   bool operator!=( const digest& other ) const { return bytes != other.bytes; }
   // Byte order, matching the order of the hex form
   bool operator<( const digest& other ) const
   {
      return std::lexicographical_compare(
         reinterpret_cast< const unsigned char* >( bytes.data() ), reinterpret_cast< const unsigned char* >( bytes.data() ) + bytes.size(),
         reinterpret_cast< const unsigned char* >( other.bytes.data() ), reinterpret_cast< const unsigned char* >( other.bytes.data() ) + other.bytes.size() );
   }
};

std::ostream& operator<<( std::ostream& os, const digest& d );

digest hash_str( const char* data, std::size_t len );

inline digest hash_str( const std::string& s )
{
   return hash_str( s.data(), s.size() );
}

digest hash_blob( const std::vector< char >& value );

void to_json( nlohmann::json& j, const digest& d );
void from_json( const nlohmann::json& j, digest& d );

} // sidecar::crypto
