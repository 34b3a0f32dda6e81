#include <sidecar/log.hpp>
#include <sidecar/sse/exceptions.hpp>
#include <sidecar/sse/stream.hpp>

#include <utility>

namespace sidecar::sse {

event_stream_writer::event_stream_writer( types::protocol_version_type version, uint64_t first_id ) :
   _api_version( std::move( version ) ),
   _next_id( first_id )
{}

frame event_stream_writer::handshake() const
{
   frame f;
   f.data = encode( _api_version );
   return f;
}

frame event_stream_writer::next( const sse_data& event )
{
   SIDECAR_ASSERT( type_of( event ) != event_type::api_version, unexpected_api_version,
      "the api version is only sent in the handshake" );

   frame f;
   f.id = _next_id++;
   f.data = encode( event );
   return f;
}

uint64_t event_stream_writer::next_id() const
{
   return _next_id;
}

event_stream_reader::event_stream_reader( bool skip_unknown ) :
   _skip_unknown( skip_unknown )
{}

void event_stream_reader::feed( const std::string& chunk )
{
   _parser.feed( chunk );
}

std::optional< stream_event > event_stream_reader::next()
{
   while ( _parser.has_frame() )
   {
      auto event = accept( _parser.pop_frame() );
      if ( event )
         return event;
   }

   return {};
}

void event_stream_reader::finish() const
{
   SIDECAR_ASSERT( _api_version, missing_api_version, "stream ended before the api version handshake" );

   if ( _parser.has_partial() )
      LOG(warning) << "Stream ended inside an unterminated frame, discarding it";
}

bool event_stream_reader::handshake_complete() const
{
   return _api_version.has_value();
}

const std::optional< api_version >& event_stream_reader::api() const
{
   return _api_version;
}

uint64_t event_stream_reader::skipped() const
{
   return _skipped;
}

std::optional< stream_event > event_stream_reader::accept( const frame& f )
{
   if ( !_api_version )
   {
      SIDECAR_ASSERT( !f.id, missing_api_version, "first frame carries event id ${id}", ("id", *f.id) );

      std::optional< sse_data > first;
      try
      {
         first = decode( f.data );
      }
      catch ( const decode_exception& ex )
      {
         SIDECAR_THROW( missing_api_version, "first frame is not an api version: ${reason}", ("reason", ex.get_message()) );
      }

      SIDECAR_ASSERT( type_of( *first ) == event_type::api_version, missing_api_version,
         "first frame is ${t}, expected ApiVersion", ("t", to_string( type_of( *first ) )) );

      _api_version = std::get< api_version >( *first );
      LOG(debug) << "Received api version " << _api_version->version();

      return stream_event{ std::nullopt, std::move( *first ) };
   }

   try
   {
      auto event = decode( f.data );

      SIDECAR_ASSERT( type_of( event ) != event_type::api_version, unexpected_api_version,
         "received a second api version, ${v}", ("v", types::to_string( std::get< api_version >( event ).version() )) );

      return stream_event{ f.id, std::move( event ) };
   }
   catch ( const unknown_event_variant& ex )
   {
      if ( !_skip_unknown )
         throw;

      _skipped++;
      LOG(warning) << "Skipping event " << ( f.id ? std::to_string( *f.id ) : std::string( "-" ) ) << ": " << ex.get_message();
   }

   return {};
}

} // sidecar::sse
