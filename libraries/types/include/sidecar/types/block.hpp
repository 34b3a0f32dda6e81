#pragma once
#include <sidecar/types/basetypes.hpp>
#include <sidecar/types/protocol_version.hpp>
#include <sidecar/types/time.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace sidecar::types {

struct reward
{
   crypto::public_key validator;
   uint64_t           amount = 0;

   bool operator==( const reward& other ) const;
};

struct validator_weight
{
   crypto::public_key validator;
   uint512_t          weight = 0;

   bool operator==( const validator_weight& other ) const;
};

struct era_report_info
{
   std::vector< crypto::public_key > equivocators;
   std::vector< reward >             rewards;
   std::vector< crypto::public_key > inactive_validators;

   bool operator==( const era_report_info& other ) const;
};

struct era_end_info
{
   era_report_info                 era_report;
   std::vector< validator_weight > next_era_validator_weights;

   bool operator==( const era_end_info& other ) const;
};

struct block_header
{
   block_hash_type               parent_hash;
   crypto::digest                state_root_hash;
   crypto::digest                body_hash;
   bool                          random_bit = false;
   crypto::digest                accumulated_seed;
   std::optional< era_end_info > era_end;          //< Set on the switch block of an era only
   timestamp_type                timestamp;
   era_id_type                   era_id;
   uint64_t                      height = 0;
   protocol_version_type         protocol_version;

   bool operator==( const block_header& other ) const;
};

struct block_body
{
   crypto::public_key              proposer;
   std::vector< deploy_hash_type > deploy_hashes;
   std::vector< deploy_hash_type > transfer_hashes;

   bool operator==( const block_body& other ) const;
};

struct block_proof
{
   crypto::public_key public_key;
   crypto::signature  signature;

   bool operator==( const block_proof& other ) const;
};

struct block
{
   block_hash_type             hash;
   block_header                header;
   block_body                  body;
   std::vector< block_proof >  proofs;

   uint64_t height() const { return header.height; }

   bool operator==( const block& other ) const;
   bool operator!=( const block& other ) const;
};

void to_json( json& j, const reward& r );
void from_json( const json& j, reward& r );

void to_json( json& j, const validator_weight& w );
void from_json( const json& j, validator_weight& w );

void to_json( json& j, const era_report_info& r );
void from_json( const json& j, era_report_info& r );

void to_json( json& j, const era_end_info& e );
void from_json( const json& j, era_end_info& e );

void to_json( json& j, const block_header& h );
void from_json( const json& j, block_header& h );

void to_json( json& j, const block_body& b );
void from_json( const json& j, block_body& b );

void to_json( json& j, const block_proof& p );
void from_json( const json& j, block_proof& p );

void to_json( json& j, const block& b );
void from_json( const json& j, block& b );

} // sidecar::types
