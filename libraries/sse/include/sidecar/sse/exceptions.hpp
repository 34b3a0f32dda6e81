#pragma once
#include <sidecar/exception.hpp>

namespace sidecar::sse {

SIDECAR_DECLARE_EXCEPTION( sse_exception );

SIDECAR_DECLARE_DERIVED_EXCEPTION( invalid_event, sse_exception );

SIDECAR_DECLARE_DERIVED_EXCEPTION( decode_exception, sse_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( unknown_event_variant, decode_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( malformed_event, decode_exception );

SIDECAR_DECLARE_DERIVED_EXCEPTION( stream_exception, sse_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( missing_api_version, stream_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( unexpected_api_version, stream_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( malformed_frame, stream_exception );

} // sidecar::sse
