#include <sidecar/types/exceptions.hpp>
#include <sidecar/types/time.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cctype>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

namespace sidecar::types {

namespace detail {

constexpr uint64_t ms_per_second = 1'000;
constexpr uint64_t ms_per_minute = 60 * ms_per_second;
constexpr uint64_t ms_per_hour   = 60 * ms_per_minute;
constexpr uint64_t ms_per_day    = 24 * ms_per_hour;
constexpr uint64_t ms_per_month  = 2'630'016 * ms_per_second;  // 30.44 days
constexpr uint64_t ms_per_year   = 31'557'600 * ms_per_second; // 365.25 days

const boost::posix_time::ptime& epoch()
{
   static const boost::posix_time::ptime e( boost::gregorian::date( 1970, 1, 1 ) );
   return e;
}

uint64_t unit_milliseconds( const std::string& unit )
{
   static const std::map< std::string, uint64_t > units = {
      { "ms",      1 },
      { "msec",    1 },
      { "s",       ms_per_second },
      { "sec",     ms_per_second },
      { "secs",    ms_per_second },
      { "second",  ms_per_second },
      { "seconds", ms_per_second },
      { "m",       ms_per_minute },
      { "min",     ms_per_minute },
      { "mins",    ms_per_minute },
      { "minute",  ms_per_minute },
      { "minutes", ms_per_minute },
      { "h",       ms_per_hour },
      { "hr",      ms_per_hour },
      { "hrs",     ms_per_hour },
      { "hour",    ms_per_hour },
      { "hours",   ms_per_hour },
      { "d",       ms_per_day },
      { "day",     ms_per_day },
      { "days",    ms_per_day },
      { "M",       ms_per_month },
      { "month",   ms_per_month },
      { "months",  ms_per_month },
      { "y",       ms_per_year },
      { "year",    ms_per_year },
      { "years",   ms_per_year }
   };

   auto itr = units.find( unit );
   SIDECAR_ASSERT( itr != units.end(), invalid_time_diff, "unknown time unit '${u}'", ("u", unit) );
   return itr->second;
}

} // detail

bool timestamp_in_range( const timestamp_type& t )
{
   return t.t <= max_timestamp_ms;
}

std::string to_string( const timestamp_type& t )
{
   SIDECAR_ASSERT( timestamp_in_range( t ), invalid_timestamp,
      "timestamp ${t}ms is past the year 9999", ("t", t.t) );

   auto time = detail::epoch() + boost::posix_time::milliseconds( static_cast< int64_t >( t.t ) );
   auto tod  = time.time_of_day();

   std::stringstream ss;
   ss << boost::gregorian::to_iso_extended_string( time.date() ) << "T";
   ss << std::setfill( '0' ) << std::setw( 2 ) << tod.hours() << ":";
   ss << std::setfill( '0' ) << std::setw( 2 ) << tod.minutes() << ":";
   ss << std::setfill( '0' ) << std::setw( 2 ) << tod.seconds() << ".";
   ss << std::setfill( '0' ) << std::setw( 3 ) << ( t.t % detail::ms_per_second ) << "Z";
   return ss.str();
}

timestamp_type timestamp_from_string( const std::string& s )
{
   SIDECAR_ASSERT( s.size() > 1 && s.back() == 'Z' && s.find( 'T' ) != std::string::npos,
      invalid_timestamp, "timestamp '${s}' is not an RFC 3339 UTC time", ("s", s) );

   boost::posix_time::ptime time;

   try
   {
      time = boost::posix_time::from_iso_extended_string( s.substr( 0, s.size() - 1 ) );
   }
   catch ( const std::exception& ex )
   {
      SIDECAR_THROW( invalid_timestamp, "unable to parse timestamp '${s}': ${reason}", ("s", s)("reason", ex.what()) );
   }

   SIDECAR_ASSERT( !time.is_special() && time >= detail::epoch(), invalid_timestamp,
      "timestamp '${s}' is before the Unix epoch", ("s", s) );

   auto result = timestamp_type( static_cast< uint64_t >( ( time - detail::epoch() ).total_milliseconds() ) );
   SIDECAR_ASSERT( timestamp_in_range( result ), invalid_timestamp, "timestamp '${s}' is past the year 9999", ("s", s) );
   return result;
}

std::string to_string( const time_diff_type& d )
{
   static const std::vector< std::pair< uint64_t, std::string > > components = {
      { detail::ms_per_year,   "year" },
      { detail::ms_per_month,  "month" },
      { detail::ms_per_day,    "day" },
      { detail::ms_per_hour,   "h" },
      { detail::ms_per_minute, "m" },
      { detail::ms_per_second, "s" },
      { 1,                     "ms" }
   };

   if ( d.t == 0 )
      return "0s";

   std::string result;
   uint64_t remaining = d.t;

   for ( const auto& [ size, unit ] : components )
   {
      uint64_t count = remaining / size;
      remaining %= size;

      if ( !count )
         continue;

      if ( !result.empty() )
         result += " ";

      result += std::to_string( count ) + unit;

      if ( count > 1 && ( unit == "day" || unit == "month" || unit == "year" ) )
         result += "s";
   }

   return result;
}

time_diff_type time_diff_from_string( const std::string& s )
{
   uint64_t total = 0;
   bool found_component = false;
   std::size_t i = 0;

   while ( i < s.size() )
   {
      if ( std::isspace( static_cast< unsigned char >( s[i] ) ) )
      {
         i++;
         continue;
      }

      std::size_t digits_start = i;
      while ( i < s.size() && std::isdigit( static_cast< unsigned char >( s[i] ) ) )
         i++;

      SIDECAR_ASSERT( i > digits_start, invalid_time_diff, "expected a number in duration '${s}'", ("s", s) );
      SIDECAR_ASSERT( i - digits_start <= 19, invalid_time_diff, "duration '${s}' is too large", ("s", s) );
      uint64_t count = std::stoull( s.substr( digits_start, i - digits_start ) );

      std::size_t unit_start = i;
      while ( i < s.size() && std::isalpha( static_cast< unsigned char >( s[i] ) ) )
         i++;

      SIDECAR_ASSERT( i > unit_start, invalid_time_diff, "missing unit in duration '${s}'", ("s", s) );
      auto unit = detail::unit_milliseconds( s.substr( unit_start, i - unit_start ) );

      SIDECAR_ASSERT( count <= ( std::numeric_limits< uint64_t >::max() - total ) / unit,
         invalid_time_diff, "duration '${s}' is too large", ("s", s) );

      total += count * unit;
      found_component = true;
   }

   SIDECAR_ASSERT( found_component, invalid_time_diff, "duration '${s}' is empty", ("s", s) );

   return time_diff_type( total );
}

void to_json( json& j, const timestamp_type& t )
{
   j = to_string( t );
}

void from_json( const json& j, timestamp_type& t )
{
   t = timestamp_from_string( j.get< std::string >() );
}

void to_json( json& j, const time_diff_type& d )
{
   j = to_string( d );
}

void from_json( const json& j, time_diff_type& d )
{
   d = time_diff_from_string( j.get< std::string >() );
}

} // sidecar::types
