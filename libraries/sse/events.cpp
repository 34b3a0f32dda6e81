#include <sidecar/sse/events.hpp>
#include <sidecar/sse/exceptions.hpp>

#include <sstream>
#include <tuple>
#include <utility>

namespace sidecar::sse {

api_version::api_version( types::protocol_version_type version ) :
   _version( std::move( version ) )
{}

const types::protocol_version_type& api_version::version() const
{
   return _version;
}

bool api_version::operator==( const api_version& other ) const
{
   return _version == other._version;
}

bool api_version::operator!=( const api_version& other ) const
{
   return !( *this == other );
}

block_added::block_added( types::block_hash_type block_hash, types::block b ) :
   _block_hash( std::move( block_hash ) ),
   _block( std::move( b ) )
{
   SIDECAR_ASSERT( types::timestamp_in_range( _block.header.timestamp ), invalid_event,
      "block timestamp ${t}ms is out of range", ("t", _block.header.timestamp.t) );
}

const types::block_hash_type& block_added::block_hash() const
{
   return _block_hash;
}

const types::block& block_added::block() const
{
   return _block;
}

std::string block_added::hex_encoded_hash() const
{
   return _block_hash.t.to_hex();
}

uint64_t block_added::get_height() const
{
   return _block.header.height;
}

bool block_added::operator==( const block_added& other ) const
{
   return std::tie( _block_hash, _block ) == std::tie( other._block_hash, other._block );
}

bool block_added::operator!=( const block_added& other ) const
{
   return !( *this == other );
}

deploy_accepted::deploy_accepted( std::shared_ptr< const types::deploy > d ) :
   _deploy( std::move( d ) )
{
   SIDECAR_ASSERT( _deploy, invalid_event, "deploy accepted event requires a deploy" );
   SIDECAR_ASSERT( types::timestamp_in_range( _deploy->header.timestamp ), invalid_event,
      "deploy timestamp ${t}ms is out of range", ("t", _deploy->header.timestamp.t) );
}

const std::shared_ptr< const types::deploy >& deploy_accepted::deploy() const
{
   return _deploy;
}

const types::deploy_hash_type& deploy_accepted::deploy_hash() const
{
   return _deploy->id();
}

std::string deploy_accepted::hex_encoded_hash() const
{
   return _deploy->id().t.to_hex();
}

bool deploy_accepted::operator==( const deploy_accepted& other ) const
{
   return _deploy == other._deploy || *_deploy == *other._deploy;
}

bool deploy_accepted::operator!=( const deploy_accepted& other ) const
{
   return !( *this == other );
}

deploy_processed::deploy_processed(
   types::deploy_hash_type deploy_hash,
   crypto::public_key account,
   types::timestamp_type timestamp,
   types::time_diff_type ttl,
   std::vector< types::deploy_hash_type > dependencies,
   types::block_hash_type block_hash,
   types::execution_result result ) :
   _deploy_hash( std::move( deploy_hash ) ),
   _account( std::move( account ) ),
   _timestamp( timestamp ),
   _ttl( ttl ),
   _dependencies( std::move( dependencies ) ),
   _block_hash( std::move( block_hash ) ),
   _execution_result( std::move( result ) )
{
   SIDECAR_ASSERT( types::timestamp_in_range( _timestamp ), invalid_event,
      "deploy timestamp ${t}ms is out of range", ("t", _timestamp.t) );
}

const types::deploy_hash_type& deploy_processed::deploy_hash() const
{
   return _deploy_hash;
}

const crypto::public_key& deploy_processed::account() const
{
   return _account;
}

types::timestamp_type deploy_processed::timestamp() const
{
   return _timestamp;
}

types::time_diff_type deploy_processed::ttl() const
{
   return _ttl;
}

const std::vector< types::deploy_hash_type >& deploy_processed::dependencies() const
{
   return _dependencies;
}

const types::block_hash_type& deploy_processed::block_hash() const
{
   return _block_hash;
}

const types::execution_result& deploy_processed::execution_result() const
{
   return _execution_result;
}

std::string deploy_processed::hex_encoded_hash() const
{
   return _deploy_hash.t.to_hex();
}

bool deploy_processed::operator==( const deploy_processed& other ) const
{
   return std::tie( _deploy_hash, _account, _timestamp, _ttl, _dependencies, _block_hash, _execution_result )
      == std::tie( other._deploy_hash, other._account, other._timestamp, other._ttl, other._dependencies, other._block_hash, other._execution_result );
}

bool deploy_processed::operator!=( const deploy_processed& other ) const
{
   return !( *this == other );
}

deploy_expired::deploy_expired( types::deploy_hash_type deploy_hash ) :
   _deploy_hash( std::move( deploy_hash ) )
{}

const types::deploy_hash_type& deploy_expired::deploy_hash() const
{
   return _deploy_hash;
}

std::string deploy_expired::hex_encoded_hash() const
{
   return _deploy_hash.t.to_hex();
}

bool deploy_expired::operator==( const deploy_expired& other ) const
{
   return _deploy_hash == other._deploy_hash;
}

bool deploy_expired::operator!=( const deploy_expired& other ) const
{
   return !( *this == other );
}

fault::fault( types::era_id_type era_id, crypto::public_key public_key, types::timestamp_type timestamp ) :
   _era_id( era_id ),
   _public_key( std::move( public_key ) ),
   _timestamp( timestamp )
{
   SIDECAR_ASSERT( types::timestamp_in_range( _timestamp ), invalid_event,
      "fault timestamp ${t}ms is out of range", ("t", _timestamp.t) );
}

types::era_id_type fault::era_id() const
{
   return _era_id;
}

const crypto::public_key& fault::public_key() const
{
   return _public_key;
}

types::timestamp_type fault::timestamp() const
{
   return _timestamp;
}

std::string fault::to_string() const
{
   std::stringstream ss;
   ss << *this;
   return ss.str();
}

std::ostream& operator<<( std::ostream& os, const fault& f )
{
   os << "Fault {\n"
      << "   era_id: " << f.era_id().t << ",\n"
      << "   public_key: " << f.public_key().to_hex() << ",\n"
      << "   timestamp: " << types::to_string( f.timestamp() ) << ",\n"
      << "}";
   return os;
}

bool fault::operator==( const fault& other ) const
{
   return std::tie( _era_id, _public_key, _timestamp ) == std::tie( other._era_id, other._public_key, other._timestamp );
}

bool fault::operator!=( const fault& other ) const
{
   return !( *this == other );
}

finality_signature::finality_signature( types::finality_signature signature ) :
   _signature( std::move( signature ) )
{}

const types::finality_signature& finality_signature::inner() const
{
   return _signature;
}

std::string finality_signature::hex_encoded_block_hash() const
{
   return _signature.block_hash.t.to_hex();
}

std::string finality_signature::hex_encoded_public_key() const
{
   return _signature.public_key.to_hex();
}

bool finality_signature::operator==( const finality_signature& other ) const
{
   return _signature == other._signature;
}

bool finality_signature::operator!=( const finality_signature& other ) const
{
   return !( *this == other );
}

step::step( types::era_id_type era_id, types::execution_effect effect ) :
   _era_id( era_id ),
   _execution_effect( std::move( effect ) )
{}

types::era_id_type step::era_id() const
{
   return _era_id;
}

const types::execution_effect& step::execution_effect() const
{
   return _execution_effect;
}

bool step::operator==( const step& other ) const
{
   return std::tie( _era_id, _execution_effect ) == std::tie( other._era_id, other._execution_effect );
}

bool step::operator!=( const step& other ) const
{
   return !( *this == other );
}

void to_json( json& j, const api_version& e )
{
   j = e.version();
}

void to_json( json& j, const block_added& e )
{
   j = json {
      { "block_hash", e.block_hash() },
      { "block",      e.block() }
   };
}

void to_json( json& j, const deploy_accepted& e )
{
   // The deploy's fields are merged into the event object without a wrapper key
   j = json::object();
   j.update( json( *e.deploy() ) );
}

void to_json( json& j, const deploy_processed& e )
{
   j = json {
      { "deploy_hash",      e.deploy_hash() },
      { "account",          e.account() },
      { "timestamp",        e.timestamp() },
      { "ttl",              e.ttl() },
      { "dependencies",     e.dependencies() },
      { "block_hash",       e.block_hash() },
      { "execution_result", e.execution_result() }
   };
}

void to_json( json& j, const deploy_expired& e )
{
   j = json {
      { "deploy_hash", e.deploy_hash() }
   };
}

void to_json( json& j, const fault& e )
{
   j = json {
      { "era_id",     e.era_id() },
      { "public_key", e.public_key() },
      { "timestamp",  e.timestamp() }
   };
}

void to_json( json& j, const finality_signature& e )
{
   j = e.inner();
}

void to_json( json& j, const step& e )
{
   j = json {
      { "era_id",           e.era_id() },
      { "execution_effect", e.execution_effect() }
   };
}

} // sidecar::sse
