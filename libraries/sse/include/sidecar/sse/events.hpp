#pragma once
#include <sidecar/types/basetypes.hpp>
#include <sidecar/types/block.hpp>
#include <sidecar/types/deploy.hpp>
#include <sidecar/types/execution_result.hpp>
#include <sidecar/types/finality_signature.hpp>
#include <sidecar/types/protocol_version.hpp>
#include <sidecar/types/time.hpp>

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace sidecar::sse {

using json = nlohmann::json;

/**
 * The version of the emitting node's event API. Always the first event sent to
 * a new subscriber and never carries an event id.
 */
class api_version
{
   public:
      explicit api_version( types::protocol_version_type version );

      const types::protocol_version_type& version() const;

      bool operator==( const api_version& other ) const;
      bool operator!=( const api_version& other ) const;

   private:
      types::protocol_version_type _version;
};

/**
 * A block was added to the linear chain and stored locally.
 */
class block_added
{
   public:
      block_added( types::block_hash_type block_hash, types::block b );

      const types::block_hash_type& block_hash() const;
      const types::block& block() const;

      std::string hex_encoded_hash() const;
      uint64_t get_height() const;

      bool operator==( const block_added& other ) const;
      bool operator!=( const block_added& other ) const;

   private:
      types::block_hash_type _block_hash;
      types::block           _block;
};

/**
 * A deploy was accepted into the node's buffer for the first time.
 *
 * The deploy is shared between every copy of the event so fanning it out to
 * many subscribers never duplicates the record.
 */
class deploy_accepted
{
   public:
      explicit deploy_accepted( std::shared_ptr< const types::deploy > d );

      const std::shared_ptr< const types::deploy >& deploy() const;
      const types::deploy_hash_type& deploy_hash() const;

      std::string hex_encoded_hash() const;

      bool operator==( const deploy_accepted& other ) const;
      bool operator!=( const deploy_accepted& other ) const;

   private:
      std::shared_ptr< const types::deploy > _deploy;
};

/**
 * A deploy was executed and committed as part of a block.
 */
class deploy_processed
{
   public:
      deploy_processed(
         types::deploy_hash_type deploy_hash,
         crypto::public_key account,
         types::timestamp_type timestamp,
         types::time_diff_type ttl,
         std::vector< types::deploy_hash_type > dependencies,
         types::block_hash_type block_hash,
         types::execution_result result );

      const types::deploy_hash_type& deploy_hash() const;
      const crypto::public_key& account() const;
      types::timestamp_type timestamp() const;
      types::time_diff_type ttl() const;
      const std::vector< types::deploy_hash_type >& dependencies() const;
      const types::block_hash_type& block_hash() const;
      const types::execution_result& execution_result() const;

      std::string hex_encoded_hash() const;

      bool operator==( const deploy_processed& other ) const;
      bool operator!=( const deploy_processed& other ) const;

   private:
      types::deploy_hash_type                _deploy_hash;
      crypto::public_key                     _account;
      types::timestamp_type                  _timestamp;
      types::time_diff_type                  _ttl;
      std::vector< types::deploy_hash_type > _dependencies;
      types::block_hash_type                 _block_hash;
      types::execution_result                _execution_result;
};

/**
 * A buffered deploy reached the end of its ttl without being included in a block.
 */
class deploy_expired
{
   public:
      explicit deploy_expired( types::deploy_hash_type deploy_hash );

      const types::deploy_hash_type& deploy_hash() const;

      std::string hex_encoded_hash() const;

      bool operator==( const deploy_expired& other ) const;
      bool operator!=( const deploy_expired& other ) const;

   private:
      types::deploy_hash_type _deploy_hash;
};

/**
 * A validator equivocated in the given era.
 */
class fault
{
   public:
      fault( types::era_id_type era_id, crypto::public_key public_key, types::timestamp_type timestamp );

      types::era_id_type era_id() const;
      const crypto::public_key& public_key() const;
      types::timestamp_type timestamp() const;

      std::string to_string() const;

      bool operator==( const fault& other ) const;
      bool operator!=( const fault& other ) const;

   private:
      types::era_id_type    _era_id;
      crypto::public_key    _public_key;
      types::timestamp_type _timestamp;
};

std::ostream& operator<<( std::ostream& os, const fault& f );

class finality_signature
{
   public:
      explicit finality_signature( types::finality_signature signature );

      const types::finality_signature& inner() const;

      std::string hex_encoded_block_hash() const;
      std::string hex_encoded_public_key() const;

      bool operator==( const finality_signature& other ) const;
      bool operator!=( const finality_signature& other ) const;

   private:
      types::finality_signature _signature;
};

/**
 * The execution effect of the era end step.
 */
class step
{
   public:
      step( types::era_id_type era_id, types::execution_effect effect );

      types::era_id_type era_id() const;
      const types::execution_effect& execution_effect() const;

      bool operator==( const step& other ) const;
      bool operator!=( const step& other ) const;

   private:
      types::era_id_type      _era_id;
      types::execution_effect _execution_effect;
};

void to_json( json& j, const api_version& e );
void to_json( json& j, const block_added& e );
void to_json( json& j, const deploy_accepted& e );
void to_json( json& j, const deploy_processed& e );
void to_json( json& j, const deploy_expired& e );
void to_json( json& j, const fault& e );
void to_json( json& j, const finality_signature& e );
void to_json( json& j, const step& e );

} // sidecar::sse
