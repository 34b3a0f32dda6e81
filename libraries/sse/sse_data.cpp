#include <sidecar/sse/exceptions.hpp>
#include <sidecar/sse/sse_data.hpp>

#include <sidecar/util.hpp>

#include <map>

namespace sidecar::sse {

namespace detail {

const std::map< std::string, event_type >& discriminators()
{
   static const std::map< std::string, event_type > m = {
      { "ApiVersion",        event_type::api_version },
      { "BlockAdded",        event_type::block_added },
      { "DeployAccepted",    event_type::deploy_accepted },
      { "DeployProcessed",   event_type::deploy_processed },
      { "DeployExpired",     event_type::deploy_expired },
      { "Fault",             event_type::fault },
      { "FinalitySignature", event_type::finality_signature },
      { "Step",              event_type::step }
   };
   return m;
}

sse_data payload_from_json( event_type t, const json& p )
{
   switch ( t )
   {
      case event_type::api_version:
         return api_version( p.get< types::protocol_version_type >() );
      case event_type::block_added:
         return block_added( p.at( "block_hash" ).get< types::block_hash_type >(), p.at( "block" ).get< types::block >() );
      case event_type::deploy_accepted:
         SIDECAR_ASSERT( p.is_object(), malformed_event, "DeployAccepted payload must be an object" );
         return deploy_accepted( std::make_shared< const types::deploy >( p.get< types::deploy >() ) );
      case event_type::deploy_processed:
         return deploy_processed(
            p.at( "deploy_hash" ).get< types::deploy_hash_type >(),
            p.at( "account" ).get< crypto::public_key >(),
            p.at( "timestamp" ).get< types::timestamp_type >(),
            p.at( "ttl" ).get< types::time_diff_type >(),
            p.at( "dependencies" ).get< std::vector< types::deploy_hash_type > >(),
            p.at( "block_hash" ).get< types::block_hash_type >(),
            p.at( "execution_result" ).get< types::execution_result >() );
      case event_type::deploy_expired:
         return deploy_expired( p.at( "deploy_hash" ).get< types::deploy_hash_type >() );
      case event_type::fault:
         return fault(
            p.at( "era_id" ).get< types::era_id_type >(),
            p.at( "public_key" ).get< crypto::public_key >(),
            p.at( "timestamp" ).get< types::timestamp_type >() );
      case event_type::finality_signature:
         return finality_signature( p.get< types::finality_signature >() );
      case event_type::step:
         return step(
            p.at( "era_id" ).get< types::era_id_type >(),
            p.at( "execution_effect" ).get< types::execution_effect >() );
   }

   SIDECAR_THROW( malformed_event, "unhandled event type ${t}", ("t", static_cast< std::size_t >( t )) );
}

} // detail

event_type type_of( const sse_data& e )
{
   return std::visit( overloaded {
      []( const api_version& )        { return event_type::api_version; },
      []( const block_added& )        { return event_type::block_added; },
      []( const deploy_accepted& )    { return event_type::deploy_accepted; },
      []( const deploy_processed& )   { return event_type::deploy_processed; },
      []( const deploy_expired& )     { return event_type::deploy_expired; },
      []( const fault& )              { return event_type::fault; },
      []( const finality_signature& ) { return event_type::finality_signature; },
      []( const step& )               { return event_type::step; }
   }, e );
}

std::string to_string( event_type t )
{
   switch ( t )
   {
      case event_type::api_version:        return "ApiVersion";
      case event_type::block_added:        return "BlockAdded";
      case event_type::deploy_accepted:    return "DeployAccepted";
      case event_type::deploy_processed:   return "DeployProcessed";
      case event_type::deploy_expired:     return "DeployExpired";
      case event_type::fault:              return "Fault";
      case event_type::finality_signature: return "FinalitySignature";
      case event_type::step:               return "Step";
   }

   return "Unknown";
}

std::string correlation_key( const sse_data& e )
{
   return std::visit( overloaded {
      []( const api_version& v )        { return types::to_string( v.version() ); },
      []( const block_added& v )        { return v.hex_encoded_hash() + " height " + std::to_string( v.get_height() ); },
      []( const deploy_accepted& v )    { return v.hex_encoded_hash(); },
      []( const deploy_processed& v )   { return v.hex_encoded_hash(); },
      []( const deploy_expired& v )     { return v.hex_encoded_hash(); },
      []( const fault& v )              { return "era " + std::to_string( v.era_id().t ) + " " + v.public_key().to_hex(); },
      []( const finality_signature& v ) { return v.hex_encoded_block_hash() + " " + v.hex_encoded_public_key(); },
      []( const step& v )               { return "era " + std::to_string( v.era_id().t ); }
   }, e );
}

json to_json_record( const sse_data& e )
{
   json payload;
   std::visit( [&]( const auto& event ) { to_json( payload, event ); }, e );

   json record = json::object();
   record[ to_string( type_of( e ) ) ] = std::move( payload );
   return record;
}

std::string encode( const sse_data& e )
{
   return to_json_record( e ).dump( -1, ' ', false, json::error_handler_t::replace );
}

sse_data from_json_record( const json& j )
{
   SIDECAR_ASSERT( j.is_object(), malformed_event, "event record must be a JSON object" );
   SIDECAR_ASSERT( j.size() == 1, malformed_event, "event record must have exactly one key, found ${n}", ("n", j.size()) );

   auto itr = j.begin();
   const auto& tag = itr.key();

   const auto& known = detail::discriminators();
   auto type_itr = known.find( tag );
   SIDECAR_ASSERT( type_itr != known.end(), unknown_event_variant, "unknown event variant '${t}'", ("t", tag) );

   try
   {
      return detail::payload_from_json( type_itr->second, itr.value() );
   }
   catch ( const malformed_event& )
   {
      throw;
   }
   catch ( const sidecar::exception& ex )
   {
      SIDECAR_THROW( malformed_event, "malformed ${t} event: ${reason}", ("t", tag)("reason", ex.get_message()) );
   }
   catch ( const std::exception& ex )
   {
      SIDECAR_THROW( malformed_event, "malformed ${t} event: ${reason}", ("t", tag)("reason", ex.what()) );
   }
}

sse_data decode( const std::string& s )
{
   json j;

   try
   {
      j = json::parse( s );
   }
   catch ( const json::parse_error& ex )
   {
      SIDECAR_THROW( malformed_event, "event record is not valid JSON: ${reason}", ("reason", ex.what()) );
   }

   return from_json_record( j );
}

} // sidecar::sse
