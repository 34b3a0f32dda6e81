#pragma once
#include <sidecar/types/basetypes.hpp>

#include <string>
#include <utility>
#include <vector>

namespace sidecar::types {

/**
 * A serialized contract value. The type descriptor and the parsed rendering are
 * opaque JSON owned by the node; only bytes are carried in binary.
 */
struct cl_value
{
   json          cl_type;
   variable_blob bytes;
   json          parsed;

   bool operator==( const cl_value& other ) const;
   bool operator!=( const cl_value& other ) const;
};

using named_arg    = std::pair< std::string, cl_value >;
using runtime_args = std::vector< named_arg >;

void to_json( json& j, const cl_value& v );
void from_json( const json& j, cl_value& v );

} // sidecar::types
