#pragma once
#include <sidecar/types/basetypes.hpp>
#include <sidecar/types/cl_value.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace sidecar::types {

enum class op_kind : uint8_t
{
   read,
   write,
   add,
   noop
};

struct operation
{
   std::string key;
   op_kind     kind = op_kind::noop;

   bool operator==( const operation& other ) const;
};

struct transform_identity
{
   bool operator==( const transform_identity& ) const { return true; }
};

struct transform_write_cl_value
{
   cl_value value;

   bool operator==( const transform_write_cl_value& other ) const { return value == other.value; }
};

struct transform_add_int32
{
   int32_t value = 0;

   bool operator==( const transform_add_int32& other ) const { return value == other.value; }
};

struct transform_add_uint64
{
   uint64_t value = 0;

   bool operator==( const transform_add_uint64& other ) const { return value == other.value; }
};

struct transform_add_uint512
{
   uint512_t value = 0;

   bool operator==( const transform_add_uint512& other ) const { return value == other.value; }
};

struct transform_failure
{
   std::string message;

   bool operator==( const transform_failure& other ) const { return message == other.message; }
};

using transform = std::variant<
   transform_identity,
   transform_write_cl_value,
   transform_add_int32,
   transform_add_uint64,
   transform_add_uint512,
   transform_failure >;

struct transform_entry
{
   std::string key;
   transform   value;

   bool operator==( const transform_entry& other ) const;
};

/**
 * The state changes produced by executing a deploy or an era end step.
 */
struct execution_effect
{
   std::vector< operation >       operations;
   std::vector< transform_entry > transforms;

   bool operator==( const execution_effect& other ) const;
   bool operator!=( const execution_effect& other ) const;
};

struct execution_success
{
   execution_effect              effect;
   std::vector< crypto::digest > transfers;
   uint512_t                     cost = 0;

   bool operator==( const execution_success& other ) const;
};

struct execution_failure
{
   execution_effect              effect;
   std::vector< crypto::digest > transfers;
   uint512_t                     cost = 0;
   std::string                   error_message;

   bool operator==( const execution_failure& other ) const;
};

using execution_result = std::variant< execution_success, execution_failure >;

const execution_effect& effect_of( const execution_result& r );

std::string to_string( op_kind k );
op_kind op_kind_from_string( const std::string& s );

std::string transfer_address_to_string( const crypto::digest& d );
crypto::digest transfer_address_from_string( const std::string& s );

void to_json( json& j, const operation& o );
void from_json( const json& j, operation& o );

void to_json( json& j, const transform_entry& t );
void from_json( const json& j, transform_entry& t );

void to_json( json& j, const execution_effect& e );
void from_json( const json& j, execution_effect& e );

void to_json( json& j, const execution_success& s );
void from_json( const json& j, execution_success& s );

void to_json( json& j, const execution_failure& f );
void from_json( const json& j, execution_failure& f );

} // sidecar::types

namespace nlohmann {

template <> struct adl_serializer< sidecar::types::transform >
{
   static void to_json( json& j, const sidecar::types::transform& t );
   static void from_json( const json& j, sidecar::types::transform& t );
};

template <> struct adl_serializer< sidecar::types::execution_result >
{
   static void to_json( json& j, const sidecar::types::execution_result& r );
   static void from_json( const json& j, sidecar::types::execution_result& r );
};

} // nlohmann
