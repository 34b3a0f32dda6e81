#include <sidecar/types/block.hpp>

#include <tuple>

namespace sidecar::types {

bool reward::operator==( const reward& other ) const
{
   return std::tie( validator, amount ) == std::tie( other.validator, other.amount );
}

bool validator_weight::operator==( const validator_weight& other ) const
{
   return std::tie( validator, weight ) == std::tie( other.validator, other.weight );
}

bool era_report_info::operator==( const era_report_info& other ) const
{
   return std::tie( equivocators, rewards, inactive_validators )
      == std::tie( other.equivocators, other.rewards, other.inactive_validators );
}

bool era_end_info::operator==( const era_end_info& other ) const
{
   return std::tie( era_report, next_era_validator_weights )
      == std::tie( other.era_report, other.next_era_validator_weights );
}

bool block_header::operator==( const block_header& other ) const
{
   return std::tie( parent_hash, state_root_hash, body_hash, random_bit, accumulated_seed, era_end, timestamp, era_id, height, protocol_version )
      == std::tie( other.parent_hash, other.state_root_hash, other.body_hash, other.random_bit, other.accumulated_seed, other.era_end,
                   other.timestamp, other.era_id, other.height, other.protocol_version );
}

bool block_body::operator==( const block_body& other ) const
{
   return std::tie( proposer, deploy_hashes, transfer_hashes )
      == std::tie( other.proposer, other.deploy_hashes, other.transfer_hashes );
}

bool block_proof::operator==( const block_proof& other ) const
{
   return std::tie( public_key, signature ) == std::tie( other.public_key, other.signature );
}

bool block::operator==( const block& other ) const
{
   return std::tie( hash, header, body, proofs ) == std::tie( other.hash, other.header, other.body, other.proofs );
}

bool block::operator!=( const block& other ) const
{
   return !( *this == other );
}

void to_json( json& j, const reward& r )
{
   j = json {
      { "validator", r.validator },
      { "amount",    r.amount }
   };
}

void from_json( const json& j, reward& r )
{
   j.at( "validator" ).get_to( r.validator );
   r.amount = uint64_from_json( j.at( "amount" ) );
}

void to_json( json& j, const validator_weight& w )
{
   j = json {
      { "validator", w.validator },
      { "weight",    to_string( w.weight ) }
   };
}

void from_json( const json& j, validator_weight& w )
{
   j.at( "validator" ).get_to( w.validator );
   w.weight = uint512_from_string( j.at( "weight" ).get< std::string >() );
}

void to_json( json& j, const era_report_info& r )
{
   j = json {
      { "equivocators",        r.equivocators },
      { "rewards",             r.rewards },
      { "inactive_validators", r.inactive_validators }
   };
}

void from_json( const json& j, era_report_info& r )
{
   j.at( "equivocators" ).get_to( r.equivocators );
   j.at( "rewards" ).get_to( r.rewards );
   j.at( "inactive_validators" ).get_to( r.inactive_validators );
}

void to_json( json& j, const era_end_info& e )
{
   j = json {
      { "era_report",                 e.era_report },
      { "next_era_validator_weights", e.next_era_validator_weights }
   };
}

void from_json( const json& j, era_end_info& e )
{
   j.at( "era_report" ).get_to( e.era_report );
   j.at( "next_era_validator_weights" ).get_to( e.next_era_validator_weights );
}

void to_json( json& j, const block_header& h )
{
   j = json {
      { "parent_hash",      h.parent_hash },
      { "state_root_hash",  h.state_root_hash },
      { "body_hash",        h.body_hash },
      { "random_bit",       h.random_bit },
      { "accumulated_seed", h.accumulated_seed },
      { "era_end",          nullptr },
      { "timestamp",        h.timestamp },
      { "era_id",           h.era_id },
      { "height",           h.height },
      { "protocol_version", h.protocol_version }
   };

   if ( h.era_end )
      j[ "era_end" ] = *h.era_end;
}

void from_json( const json& j, block_header& h )
{
   j.at( "parent_hash" ).get_to( h.parent_hash );
   j.at( "state_root_hash" ).get_to( h.state_root_hash );
   j.at( "body_hash" ).get_to( h.body_hash );
   j.at( "random_bit" ).get_to( h.random_bit );
   j.at( "accumulated_seed" ).get_to( h.accumulated_seed );

   const auto& era_end = j.at( "era_end" );
   if ( era_end.is_null() )
      h.era_end.reset();
   else
      h.era_end = era_end.get< era_end_info >();

   j.at( "timestamp" ).get_to( h.timestamp );
   j.at( "era_id" ).get_to( h.era_id );
   h.height = uint64_from_json( j.at( "height" ) );
   j.at( "protocol_version" ).get_to( h.protocol_version );
}

void to_json( json& j, const block_body& b )
{
   j = json {
      { "proposer",        b.proposer },
      { "deploy_hashes",   b.deploy_hashes },
      { "transfer_hashes", b.transfer_hashes }
   };
}

void from_json( const json& j, block_body& b )
{
   j.at( "proposer" ).get_to( b.proposer );
   j.at( "deploy_hashes" ).get_to( b.deploy_hashes );
   j.at( "transfer_hashes" ).get_to( b.transfer_hashes );
}

void to_json( json& j, const block_proof& p )
{
   j = json {
      { "public_key", p.public_key },
      { "signature",  p.signature }
   };
}

void from_json( const json& j, block_proof& p )
{
   j.at( "public_key" ).get_to( p.public_key );
   j.at( "signature" ).get_to( p.signature );
}

void to_json( json& j, const block& b )
{
   j = json {
      { "hash",   b.hash },
      { "header", b.header },
      { "body",   b.body },
      { "proofs", b.proofs }
   };
}

void from_json( const json& j, block& b )
{
   j.at( "hash" ).get_to( b.hash );
   j.at( "header" ).get_to( b.header );
   j.at( "body" ).get_to( b.body );
   j.at( "proofs" ).get_to( b.proofs );
}

} // sidecar::types
