#include <sidecar/sse/exceptions.hpp>
#include <sidecar/sse/frame.hpp>

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace sidecar::sse {

bool frame::operator==( const frame& other ) const
{
   return std::tie( id, data ) == std::tie( other.id, other.data );
}

bool frame::operator!=( const frame& other ) const
{
   return !( *this == other );
}

std::string to_wire( const frame& f )
{
   std::vector< std::string > lines;
   boost::split( lines, f.data, boost::is_any_of( "\n" ) );

   std::string wire;
   for ( const auto& line : lines )
      wire += "data:" + line + "\n";

   if ( f.id )
      wire += "id:" + std::to_string( *f.id ) + "\n";

   wire += "\n";
   return wire;
}

void frame_parser::feed( const std::string& chunk )
{
   for ( char c : chunk )
   {
      if ( c == '\n' )
      {
         process_line( std::move( _line ) );
         _line.clear();
      }
      else
      {
         _line.push_back( c );
      }
   }
}

bool frame_parser::has_frame() const
{
   return !_frames.empty();
}

frame frame_parser::pop_frame()
{
   SIDECAR_ASSERT( !_frames.empty(), malformed_frame, "no complete frame is available" );

   frame f = std::move( _frames.front() );
   _frames.pop_front();
   return f;
}

bool frame_parser::has_partial() const
{
   return !_line.empty() || _has_data || _id.has_value();
}

void frame_parser::process_line( std::string line )
{
   if ( !line.empty() && line.back() == '\r' )
      line.pop_back();

   if ( line.empty() )
   {
      dispatch();
      return;
   }

   // Comment
   if ( line.front() == ':' )
      return;

   std::string field, value;
   auto colon = line.find( ':' );
   if ( colon == std::string::npos )
   {
      field = line;
   }
   else
   {
      field = line.substr( 0, colon );
      value = line.substr( colon + 1 );
      if ( !value.empty() && value.front() == ' ' )
         value.erase( 0, 1 );
   }

   if ( field == "data" )
   {
      if ( _has_data )
         _data += "\n";
      _data += value;
      _has_data = true;
   }
   else if ( field == "id" )
   {
      bool numeric = !value.empty() && value.size() <= 20
         && std::all_of( value.begin(), value.end(), []( char c ) { return std::isdigit( static_cast< unsigned char >( c ) ); } );
      SIDECAR_ASSERT( numeric, malformed_frame, "event id '${id}' is not an unsigned integer", ("id", value) );

      try
      {
         _id = std::stoull( value );
      }
      catch ( const std::out_of_range& )
      {
         SIDECAR_THROW( malformed_frame, "event id '${id}' is out of range", ("id", value) );
      }
   }
}

void frame_parser::dispatch()
{
   if ( _has_data )
   {
      frame f;
      f.id = _id;
      f.data = std::move( _data );
      _frames.push_back( std::move( f ) );
   }

   _data.clear();
   _has_data = false;
   _id.reset();
}

} // sidecar::sse
