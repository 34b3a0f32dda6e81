#pragma once
#include <sidecar/exception.hpp>

namespace sidecar::crypto {

SIDECAR_DECLARE_EXCEPTION( crypto_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( digest_size_mismatch, crypto_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( unknown_key_algorithm, crypto_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( key_size_mismatch, crypto_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( hash_failure, crypto_exception );

} // sidecar::crypto
