#pragma once
#include <sidecar/types/basetypes.hpp>

#include <cstdint>
#include <ostream>
#include <string>

namespace sidecar::types {

struct protocol_version_type
{
   uint32_t major_version = 0;
   uint32_t minor_version = 0;
   uint32_t patch_version = 0;

   bool operator==( const protocol_version_type& other ) const;
   bool operator!=( const protocol_version_type& other ) const;
   bool operator<( const protocol_version_type& other ) const;
};

std::string to_string( const protocol_version_type& v );
protocol_version_type protocol_version_from_string( const std::string& s );

std::ostream& operator<<( std::ostream& os, const protocol_version_type& v );

void to_json( json& j, const protocol_version_type& v );
void from_json( const json& j, protocol_version_type& v );

} // sidecar::types
