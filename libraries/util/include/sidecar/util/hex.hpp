#pragma once

#include <sidecar/exception.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sidecar::util {

SIDECAR_DECLARE_EXCEPTION( hex_decode_error );

std::string to_hex( const char* data, std::size_t len );

template< typename Blob >
inline std::string to_hex( const Blob& b )
{
   return to_hex( reinterpret_cast< const char* >( b.data() ), b.size() );
}

/**
 * Decodes a hex string of either case. An optional "0x" prefix is accepted.
 *
 * Throws hex_decode_error on odd length input or a non hex character.
 */
std::vector< char > from_hex( const std::string& s );

/**
 * Decodes into a buffer of exactly len bytes. Throws hex_decode_error on size mismatch.
 */
void from_hex( const std::string& s, char* out, std::size_t len );

} // sidecar::util
