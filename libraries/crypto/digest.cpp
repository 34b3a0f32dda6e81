#include <sidecar/crypto/digest.hpp>

#include <sidecar/util/hex.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <memory>

namespace sidecar::crypto {

std::string digest::to_hex() const
{
   return util::to_hex( bytes );
}

digest digest::from_hex( const std::string& s )
{
   digest d;
   util::from_hex( s, d.bytes.data(), d.bytes.size() );
   return d;
}

digest digest::from_bytes( const std::vector< char >& b )
{
   SIDECAR_ASSERT( b.size() == digest_length, digest_size_mismatch,
      "digest must be ${e} bytes, found ${a}", ("e", digest_length)("a", b.size()) );
   digest d;
   std::copy( b.begin(), b.end(), d.bytes.begin() );
   return d;
}

std::ostream& operator<<( std::ostream& os, const digest& d )
{
   return os << d.to_hex();
}

digest hash_str( const char* data, std::size_t len )
{
   std::unique_ptr< EVP_MD_CTX, decltype( &EVP_MD_CTX_free ) > mdctx( EVP_MD_CTX_new(), &EVP_MD_CTX_free );
   SIDECAR_ASSERT( mdctx, hash_failure, "unable to allocate digest context" );

   digest result;
   unsigned int size = 0;

   SIDECAR_ASSERT( EVP_DigestInit_ex( mdctx.get(), EVP_sha256(), nullptr ), hash_failure, "EVP_DigestInit_ex returned failure" );
   SIDECAR_ASSERT( EVP_DigestUpdate( mdctx.get(), data, len ), hash_failure, "EVP_DigestUpdate returned failure" );
   SIDECAR_ASSERT(
      EVP_DigestFinal_ex( mdctx.get(), reinterpret_cast< unsigned char* >( result.bytes.data() ), &size ),
      hash_failure, "EVP_DigestFinal_ex returned failure" );
   SIDECAR_ASSERT( size == digest_length, digest_size_mismatch,
      "OpenSSL EVP_DigestFinal_ex returned hash size ${size}, does not match expected hash size ${expected}",
      ("size", std::size_t( size ))("expected", digest_length) );

   return result;
}

digest hash_blob( const std::vector< char >& value )
{
   return hash_str( value.data(), value.size() );
}

void to_json( nlohmann::json& j, const digest& d )
{
   j = d.to_hex();
}

void from_json( const nlohmann::json& j, digest& d )
{
   d = digest::from_hex( j.get< std::string >() );
}

} // sidecar::crypto
