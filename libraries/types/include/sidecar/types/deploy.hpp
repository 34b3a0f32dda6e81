#pragma once
#include <sidecar/types/basetypes.hpp>
#include <sidecar/types/cl_value.hpp>
#include <sidecar/types/time.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace sidecar::types {

struct module_bytes_item
{
   variable_blob module_bytes;
   runtime_args  args;

   bool operator==( const module_bytes_item& other ) const;
};

struct stored_contract_by_hash_item
{
   crypto::digest hash;
   std::string    entry_point;
   runtime_args   args;

   bool operator==( const stored_contract_by_hash_item& other ) const;
};

struct stored_contract_by_name_item
{
   std::string  name;
   std::string  entry_point;
   runtime_args args;

   bool operator==( const stored_contract_by_name_item& other ) const;
};

struct transfer_item
{
   runtime_args args;

   bool operator==( const transfer_item& other ) const;
};

using executable_deploy_item = std::variant<
   module_bytes_item,
   stored_contract_by_hash_item,
   stored_contract_by_name_item,
   transfer_item >;

struct deploy_header
{
   crypto::public_key              account;
   timestamp_type                  timestamp;
   time_diff_type                  ttl;
   uint64_t                        gas_price = 0;
   crypto::digest                  body_hash;
   std::vector< deploy_hash_type > dependencies;   //< Declaration order, duplicates kept
   std::string                     chain_name;

   bool operator==( const deploy_header& other ) const;
};

struct approval
{
   crypto::public_key signer;
   crypto::signature  signature;

   bool operator==( const approval& other ) const;
};

struct deploy
{
   deploy_hash_type         hash;
   deploy_header            header;
   executable_deploy_item   payment;
   executable_deploy_item   session;
   std::vector< approval >  approvals;

   const deploy_hash_type& id() const { return hash; }

   bool operator==( const deploy& other ) const;
   bool operator!=( const deploy& other ) const;
};

void to_json( json& j, const module_bytes_item& i );
void from_json( const json& j, module_bytes_item& i );

void to_json( json& j, const stored_contract_by_hash_item& i );
void from_json( const json& j, stored_contract_by_hash_item& i );

void to_json( json& j, const stored_contract_by_name_item& i );
void from_json( const json& j, stored_contract_by_name_item& i );

void to_json( json& j, const transfer_item& i );
void from_json( const json& j, transfer_item& i );

void to_json( json& j, const deploy_header& h );
void from_json( const json& j, deploy_header& h );

void to_json( json& j, const approval& a );
void from_json( const json& j, approval& a );

void to_json( json& j, const deploy& d );
void from_json( const json& j, deploy& d );

} // sidecar::types

namespace nlohmann {

template <> struct adl_serializer< sidecar::types::executable_deploy_item >
{
   static void to_json( json& j, const sidecar::types::executable_deploy_item& i );
   static void from_json( const json& j, sidecar::types::executable_deploy_item& i );
};

} // nlohmann
