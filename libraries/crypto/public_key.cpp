#include <sidecar/crypto/public_key.hpp>

#include <sidecar/util/hex.hpp>

#include <algorithm>

namespace sidecar::crypto {

namespace detail {

key_algorithm to_key_algorithm( char tag )
{
   switch ( static_cast< uint8_t >( tag ) )
   {
      case uint8_t( key_algorithm::system ):
         return key_algorithm::system;
      case uint8_t( key_algorithm::ed25519 ):
         return key_algorithm::ed25519;
      case uint8_t( key_algorithm::secp256k1 ):
         return key_algorithm::secp256k1;
      default:
         break;
   }

   SIDECAR_THROW( unknown_key_algorithm, "unknown key algorithm tag ${t}", ("t", uint32_t( static_cast< uint8_t >( tag ) )) );
}

std::string tagged_hex( key_algorithm algo, const std::vector< char >& bytes )
{
   std::vector< char > tagged;
   tagged.reserve( bytes.size() + 1 );
   tagged.push_back( static_cast< char >( algo ) );
   tagged.insert( tagged.end(), bytes.begin(), bytes.end() );
   return util::to_hex( tagged );
}

// Compares as unsigned bytes so the order agrees with the hex form
bool tagged_less( key_algorithm a_algo, const std::vector< char >& a, key_algorithm b_algo, const std::vector< char >& b )
{
   if ( a_algo != b_algo )
      return static_cast< uint8_t >( a_algo ) < static_cast< uint8_t >( b_algo );

   return std::lexicographical_compare(
      a.begin(), a.end(), b.begin(), b.end(),
      []( char x, char y ) { return static_cast< unsigned char >( x ) < static_cast< unsigned char >( y ); } );
}

std::pair< key_algorithm, std::vector< char > > split_tagged( const std::string& s )
{
   auto raw = util::from_hex( s );
   SIDECAR_ASSERT( raw.size() > 0, key_size_mismatch, "tagged hex value is empty" );
   auto algo = to_key_algorithm( raw[0] );
   return std::make_pair( algo, std::vector< char >( raw.begin() + 1, raw.end() ) );
}

} // detail

std::size_t public_key_length( key_algorithm algo )
{
   switch ( algo )
   {
      case key_algorithm::system:
         return 0;
      case key_algorithm::ed25519:
         return 32;
      case key_algorithm::secp256k1:
         return 33;
   }

   SIDECAR_THROW( unknown_key_algorithm, "unknown key algorithm" );
}

std::size_t signature_length( key_algorithm algo )
{
   switch ( algo )
   {
      case key_algorithm::system:
         return 0;
      case key_algorithm::ed25519:
      case key_algorithm::secp256k1:
         return 64;
   }

   SIDECAR_THROW( unknown_key_algorithm, "unknown key algorithm" );
}

std::string to_string( key_algorithm algo )
{
   switch ( algo )
   {
      case key_algorithm::system:
         return "system";
      case key_algorithm::ed25519:
         return "ed25519";
      case key_algorithm::secp256k1:
         return "secp256k1";
   }

   return "unknown";
}

public_key::public_key() = default;

public_key::public_key( key_algorithm algo, std::vector< char > bytes ) :
   _algorithm( algo ),
   _bytes( std::move( bytes ) )
{
   SIDECAR_ASSERT( _bytes.size() == public_key_length( _algorithm ), key_size_mismatch,
      "${algo} public key must be ${e} bytes, found ${a}",
      ("algo", to_string( _algorithm ))("e", public_key_length( _algorithm ))("a", _bytes.size()) );
}

key_algorithm public_key::algorithm() const
{
   return _algorithm;
}

const std::vector< char >& public_key::bytes() const
{
   return _bytes;
}

std::string public_key::to_hex() const
{
   return detail::tagged_hex( _algorithm, _bytes );
}

public_key public_key::from_hex( const std::string& s )
{
   auto [ algo, bytes ] = detail::split_tagged( s );
   return public_key( algo, std::move( bytes ) );
}

bool public_key::operator==( const public_key& other ) const
{
   return _algorithm == other._algorithm && _bytes == other._bytes;
}

bool public_key::operator!=( const public_key& other ) const
{
   return !( *this == other );
}

bool public_key::operator<( const public_key& other ) const
{
   return detail::tagged_less( _algorithm, _bytes, other._algorithm, other._bytes );
}

signature::signature() = default;

signature::signature( key_algorithm algo, std::vector< char > bytes ) :
   _algorithm( algo ),
   _bytes( std::move( bytes ) )
{
   SIDECAR_ASSERT( _bytes.size() == signature_length( _algorithm ), key_size_mismatch,
      "${algo} signature must be ${e} bytes, found ${a}",
      ("algo", to_string( _algorithm ))("e", signature_length( _algorithm ))("a", _bytes.size()) );
}

key_algorithm signature::algorithm() const
{
   return _algorithm;
}

const std::vector< char >& signature::bytes() const
{
   return _bytes;
}

std::string signature::to_hex() const
{
   return detail::tagged_hex( _algorithm, _bytes );
}

signature signature::from_hex( const std::string& s )
{
   auto [ algo, bytes ] = detail::split_tagged( s );
   return signature( algo, std::move( bytes ) );
}

bool signature::operator==( const signature& other ) const
{
   return _algorithm == other._algorithm && _bytes == other._bytes;
}

bool signature::operator!=( const signature& other ) const
{
   return !( *this == other );
}

std::ostream& operator<<( std::ostream& os, const public_key& k )
{
   return os << k.to_hex();
}

std::ostream& operator<<( std::ostream& os, const signature& s )
{
   return os << s.to_hex();
}

void to_json( nlohmann::json& j, const public_key& k )
{
   j = k.to_hex();
}

void from_json( const nlohmann::json& j, public_key& k )
{
   k = public_key::from_hex( j.get< std::string >() );
}

void to_json( nlohmann::json& j, const signature& s )
{
   j = s.to_hex();
}

void from_json( const nlohmann::json& j, signature& s )
{
   s = signature::from_hex( j.get< std::string >() );
}

} // sidecar::crypto
