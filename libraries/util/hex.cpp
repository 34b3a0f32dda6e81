#include <sidecar/util/hex.hpp>

#include <algorithm>

namespace sidecar::util {

namespace detail {

int8_t hex_value( char c )
{
   if ( c >= '0' && c <= '9' ) return c - '0';
   if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
   if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
   return -1;
}

std::size_t hex_start( const std::string& s )
{
   if ( s.size() >= 2 && s[0] == '0' && ( s[1] == 'x' || s[1] == 'X' ) )
      return 2;
   return 0;
}

} // detail

std::string to_hex( const char* data, std::size_t len )
{
   static const char hex[16] = {'0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'};

   std::string result;
   result.reserve( len * 2 );

   for ( std::size_t i = 0; i < len; i++ )
   {
      auto c = static_cast< uint8_t >( data[i] );
      result += hex[(c & 0xF0) >> 4];
      result += hex[c & 0x0F];
   }

   return result;
}

std::vector< char > from_hex( const std::string& s )
{
   auto start = detail::hex_start( s );
   SIDECAR_ASSERT( ( s.size() - start ) % 2 == 0, hex_decode_error, "hex string has odd length ${l}", ("l", s.size() - start) );

   std::vector< char > result;
   result.reserve( ( s.size() - start ) / 2 );

   for ( std::size_t i = start; i < s.size(); i += 2 )
   {
      auto hi = detail::hex_value( s[i] );
      auto lo = detail::hex_value( s[i+1] );
      SIDECAR_ASSERT( hi >= 0 && lo >= 0, hex_decode_error, "invalid hex character at position ${p}", ("p", i) );
      result.push_back( static_cast< char >( ( hi << 4 ) | lo ) );
   }

   return result;
}

void from_hex( const std::string& s, char* out, std::size_t len )
{
   auto bytes = from_hex( s );
   SIDECAR_ASSERT( bytes.size() == len, hex_decode_error, "expected ${e} bytes of hex, found ${a}", ("e", len)("a", bytes.size()) );
   std::copy( bytes.begin(), bytes.end(), out );
}

} // sidecar::util
