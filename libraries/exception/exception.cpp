#include <sidecar/exception.hpp>

#include <sstream>

namespace sidecar { namespace detail {

namespace {

// Strings are substituted without their json quotes
std::string substitution_text( const nlohmann::json& value )
{
   if ( value.is_string() )
      return value.get< std::string >();

   return value.dump();
}

nlohmann::json& context_of( exception& e )
{
   return *boost::get_error_info< json_info >( e );
}

const nlohmann::json& context_of( const exception& e )
{
   return *boost::get_error_info< json_info >( e );
}

} // anonymous

std::string json_strpolate( const std::string& format_str, const nlohmann::json& j )
{
   std::string result;
   result.reserve( format_str.size() );

   std::size_t pos = 0;

   while ( pos < format_str.size() )
   {
      auto open = format_str.find( "${", pos );
      if ( open == std::string::npos )
         break;

      result.append( format_str, pos, open - pos );
      pos = open;

      // ${$ is a literal ${
      if ( open + 2 < format_str.size() && format_str[ open + 2 ] == '$' )
      {
         result.append( format_str, open, 3 );
         pos = open + 3;
         continue;
      }

      auto close = format_str.find( '}', open + 2 );
      if ( close == std::string::npos )
         break;

      auto itr = j.find( format_str.substr( open + 2, close - open - 2 ) );
      if ( itr != j.end() )
         result += substitution_text( *itr );
      else
         result.append( format_str, open, close - open + 1 );

      pos = close + 1;
   }

   if ( pos < format_str.size() )
      result.append( format_str, pos, std::string::npos );

   return result;
}

json_initializer::json_initializer( exception& e ) :
   _e( e ),
   _j( context_of( e ) )
{}

json_initializer& json_initializer::operator()( const std::string& key, const char* c )
{
   _j[ key ] = c;
   _e.do_message_substitution();
   return *this;
}

json_initializer& json_initializer::operator()( const std::string& key, std::size_t v )
{
   _j[ key ] = uint64_t( v );
   _e.do_message_substitution();
   return *this;
}

json_initializer& json_initializer::operator()()
{
   return *this;
}

} // detail

exception::exception()
{
   *this << detail::json_info( nlohmann::json::object() );
}

exception::exception( const std::string& m ) : exception()
{
   msg = m;
}

exception::exception( std::string&& m ) : exception()
{
   msg = std::move( m );
}

exception::~exception() = default;

const char* exception::what() const noexcept
{
   return msg.c_str();
}

std::string exception::get_stacktrace() const
{
   auto trace = boost::get_error_info< detail::exception_stacktrace >( *this );
   if ( !trace )
      return std::string();

   std::stringstream ss;
   ss << *trace;
   return ss.str();
}

const nlohmann::json& exception::get_json() const
{
   return detail::context_of( *this );
}

const std::string& exception::get_message() const
{
   return msg;
}

void exception::do_message_substitution()
{
   msg = detail::json_strpolate( msg, detail::context_of( *this ) );
}

} // sidecar
