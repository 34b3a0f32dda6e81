#pragma once
#include <sidecar/crypto/exceptions.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace sidecar::crypto {

/*
 * The tag byte that leads the canonical form of keys and signatures.
 */
enum class key_algorithm : uint8_t
{
   system    = 0,
   ed25519   = 1,
   secp256k1 = 2
};

std::size_t public_key_length( key_algorithm algo );
std::size_t signature_length( key_algorithm algo );
std::string to_string( key_algorithm algo );

class public_key
{
   public:
      public_key();
      public_key( key_algorithm algo, std::vector< char > bytes );

      key_algorithm algorithm() const;
      const std::vector< char >& bytes() const;

      /**
       * Tag byte followed by the key bytes, lowercase.
       */
      std::string to_hex() const;
      static public_key from_hex( const std::string& s );

      bool operator==( const public_key& other ) const;
      bool operator!=( const public_key& other ) const;
      bool operator<( const public_key& other ) const;

   private:
      key_algorithm       _algorithm = key_algorithm::system;
      std::vector< char > _bytes;
};

class signature
{
   public:
      signature();
      signature( key_algorithm algo, std::vector< char > bytes );

      key_algorithm algorithm() const;
      const std::vector< char >& bytes() const;

      std::string to_hex() const;
      static signature from_hex( const std::string& s );

      bool operator==( const signature& other ) const;
      bool operator!=( const signature& other ) const;

   private:
      key_algorithm       _algorithm = key_algorithm::system;
      std::vector< char > _bytes;
};

std::ostream& operator<<( std::ostream& os, const public_key& k );
std::ostream& operator<<( std::ostream& os, const signature& s );

void to_json( nlohmann::json& j, const public_key& k );
void from_json( const nlohmann::json& j, public_key& k );

void to_json( nlohmann::json& j, const signature& s );
void from_json( const nlohmann::json& j, signature& s );

} // sidecar::crypto
