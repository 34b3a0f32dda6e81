#include <sidecar/types/deploy.hpp>
#include <sidecar/types/exceptions.hpp>

#include <sidecar/util.hpp>
#include <sidecar/util/hex.hpp>

#include <tuple>

namespace sidecar::types {

bool module_bytes_item::operator==( const module_bytes_item& other ) const
{
   return std::tie( module_bytes, args ) == std::tie( other.module_bytes, other.args );
}

bool stored_contract_by_hash_item::operator==( const stored_contract_by_hash_item& other ) const
{
   return std::tie( hash, entry_point, args ) == std::tie( other.hash, other.entry_point, other.args );
}

bool stored_contract_by_name_item::operator==( const stored_contract_by_name_item& other ) const
{
   return std::tie( name, entry_point, args ) == std::tie( other.name, other.entry_point, other.args );
}

bool transfer_item::operator==( const transfer_item& other ) const
{
   return args == other.args;
}

bool deploy_header::operator==( const deploy_header& other ) const
{
   return std::tie( account, timestamp, ttl, gas_price, body_hash, dependencies, chain_name )
      == std::tie( other.account, other.timestamp, other.ttl, other.gas_price, other.body_hash, other.dependencies, other.chain_name );
}

bool approval::operator==( const approval& other ) const
{
   return std::tie( signer, signature ) == std::tie( other.signer, other.signature );
}

bool deploy::operator==( const deploy& other ) const
{
   return std::tie( hash, header, payment, session, approvals )
      == std::tie( other.hash, other.header, other.payment, other.session, other.approvals );
}

bool deploy::operator!=( const deploy& other ) const
{
   return !( *this == other );
}

void to_json( json& j, const module_bytes_item& i )
{
   j = json {
      { "module_bytes", util::to_hex( i.module_bytes ) },
      { "args",         i.args }
   };
}

void from_json( const json& j, module_bytes_item& i )
{
   i.module_bytes = util::from_hex( j.at( "module_bytes" ).get< std::string >() );
   j.at( "args" ).get_to( i.args );
}

void to_json( json& j, const stored_contract_by_hash_item& i )
{
   j = json {
      { "hash",        i.hash },
      { "entry_point", i.entry_point },
      { "args",        i.args }
   };
}

void from_json( const json& j, stored_contract_by_hash_item& i )
{
   j.at( "hash" ).get_to( i.hash );
   j.at( "entry_point" ).get_to( i.entry_point );
   j.at( "args" ).get_to( i.args );
}

void to_json( json& j, const stored_contract_by_name_item& i )
{
   j = json {
      { "name",        i.name },
      { "entry_point", i.entry_point },
      { "args",        i.args }
   };
}

void from_json( const json& j, stored_contract_by_name_item& i )
{
   j.at( "name" ).get_to( i.name );
   j.at( "entry_point" ).get_to( i.entry_point );
   j.at( "args" ).get_to( i.args );
}

void to_json( json& j, const transfer_item& i )
{
   j = json {
      { "args", i.args }
   };
}

void from_json( const json& j, transfer_item& i )
{
   j.at( "args" ).get_to( i.args );
}

void to_json( json& j, const deploy_header& h )
{
   j = json {
      { "account",      h.account },
      { "timestamp",    h.timestamp },
      { "ttl",          h.ttl },
      { "gas_price",    h.gas_price },
      { "body_hash",    h.body_hash },
      { "dependencies", h.dependencies },
      { "chain_name",   h.chain_name }
   };
}

void from_json( const json& j, deploy_header& h )
{
   j.at( "account" ).get_to( h.account );
   j.at( "timestamp" ).get_to( h.timestamp );
   j.at( "ttl" ).get_to( h.ttl );
   h.gas_price = uint64_from_json( j.at( "gas_price" ) );
   j.at( "body_hash" ).get_to( h.body_hash );
   j.at( "dependencies" ).get_to( h.dependencies );
   j.at( "chain_name" ).get_to( h.chain_name );
}

void to_json( json& j, const approval& a )
{
   j = json {
      { "signer",    a.signer },
      { "signature", a.signature }
   };
}

void from_json( const json& j, approval& a )
{
   j.at( "signer" ).get_to( a.signer );
   j.at( "signature" ).get_to( a.signature );
}

void to_json( json& j, const deploy& d )
{
   j = json {
      { "hash",      d.hash },
      { "header",    d.header },
      { "payment",   d.payment },
      { "session",   d.session },
      { "approvals", d.approvals }
   };
}

void from_json( const json& j, deploy& d )
{
   j.at( "hash" ).get_to( d.hash );
   j.at( "header" ).get_to( d.header );
   j.at( "payment" ).get_to( d.payment );
   j.at( "session" ).get_to( d.session );
   j.at( "approvals" ).get_to( d.approvals );
}

} // sidecar::types

namespace nlohmann {

namespace types = sidecar::types;

void adl_serializer< types::executable_deploy_item >::to_json( json& j, const types::executable_deploy_item& i )
{
   std::visit( sidecar::overloaded {
      [&]( const types::module_bytes_item& arg )            { j = json { { "ModuleBytes", arg } }; },
      [&]( const types::stored_contract_by_hash_item& arg ) { j = json { { "StoredContractByHash", arg } }; },
      [&]( const types::stored_contract_by_name_item& arg ) { j = json { { "StoredContractByName", arg } }; },
      [&]( const types::transfer_item& arg )                { j = json { { "Transfer", arg } }; }
   }, i );
}

void adl_serializer< types::executable_deploy_item >::from_json( const json& j, types::executable_deploy_item& i )
{
   SIDECAR_ASSERT( j.is_object() && j.size() == 1, types::unknown_variant_tag, "executable deploy item must be a single key object" );

   auto itr = j.begin();
   const auto& tag = itr.key();

   if ( tag == "ModuleBytes" )
      i = itr.value().get< types::module_bytes_item >();
   else if ( tag == "StoredContractByHash" )
      i = itr.value().get< types::stored_contract_by_hash_item >();
   else if ( tag == "StoredContractByName" )
      i = itr.value().get< types::stored_contract_by_name_item >();
   else if ( tag == "Transfer" )
      i = itr.value().get< types::transfer_item >();
   else
      SIDECAR_THROW( types::unknown_variant_tag, "unknown executable deploy item '${t}'", ("t", tag) );
}

} // nlohmann
