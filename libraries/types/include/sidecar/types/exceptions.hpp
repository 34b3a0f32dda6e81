#pragma once
#include <sidecar/exception.hpp>

namespace sidecar::types {

SIDECAR_DECLARE_EXCEPTION( types_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( invalid_timestamp, types_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( invalid_time_diff, types_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( invalid_protocol_version, types_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( invalid_transfer_address, types_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( invalid_amount, types_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( invalid_number, types_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( unknown_variant_tag, types_exception );

} // sidecar::types
