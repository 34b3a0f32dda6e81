#include <boost/test/unit_test.hpp>
#include <boost/filesystem.hpp>
#include <fstream>
#include <vector>
#include <string>
#include <sstream>
#include <boost/algorithm/string.hpp>

#include <sidecar/log.hpp>

struct log_fixture
{
   std::vector< std::string > capture( bool color, const std::string& level, std::vector< std::string >& file_lines )
   {
      std::stringstream stream;
      auto buf = std::cout.rdbuf();
      std::cout.rdbuf( stream.rdbuf() );

      auto temp = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path();
      boost::filesystem::create_directory( temp );
      sidecar::initialize_logging( temp.string(), "log_test_%3N.log", level, color );

      LOG( trace )   << "test";
      LOG( debug )   << "test";
      LOG( info )    << "test";
      LOG( warning ) << "test";
      LOG( error )   << "test";
      LOG( fatal )   << "test";

      // We go around our macro in order to invoke an unknown log level
      BOOST_LOG_SEV(::boost::log::trivial::logger::get(), boost::log::trivial::severity_level(10))
         << boost::log::add_value("Line", __LINE__)
         << boost::log::add_value("File", boost::filesystem::path(__FILE__).filename().string()) << "test";

      // Setting std::cout back to normal
      std::cout.rdbuf( buf );

      auto file_path = temp / "log_test_000.log";
      std::ifstream file( file_path.string() );
      BOOST_REQUIRE( file.is_open() );

      std::string line;
      while ( std::getline( file, line ) )
         file_lines.push_back( line );

      std::vector< std::string > results;
      std::string stream_str = stream.str();
      boost::split( results, stream_str, boost::is_any_of( "\n" ) );
      results.pop_back();

      return results;
   }

   void require_levels( const std::vector< std::string >& results, const std::vector< std::string >& logtypes )
   {
      BOOST_REQUIRE_EQUAL( results.size(), logtypes.size() );
      for ( std::size_t i = 0; i < results.size(); i++ )
      {
         auto pos = results[i].find( "<" );
         std::string expected_result = results[i].substr( pos );
         BOOST_REQUIRE_EQUAL( logtypes[i] + ": test", expected_result );
      }
   }
};

BOOST_FIXTURE_TEST_SUITE( log_tests, log_fixture )

BOOST_AUTO_TEST_CASE( log_color_tests )
{
   BOOST_TEST_MESSAGE( "Testing logging library with color" );

   std::vector< std::string > logtypes {
       "<\033[32mtrace\033[0m>",
       "<\033[32mdebug\033[0m>",
       "<\033[32minfo\033[0m>",
       "<\033[33mwarning\033[0m>",
       "<\033[31merror\033[0m>",
       "<\033[31mfatal\033[0m>",
       "<\033[31munknown\033[0m>"
   };

   std::vector< std::string > file_lines;
   auto results = capture( true, "trace", file_lines );

   BOOST_REQUIRE( file_lines.size() > 0 );
   auto pos = file_lines[0].find( "<" );
   BOOST_REQUIRE_EQUAL( "<trace>: test", file_lines[0].substr( pos ) );

   require_levels( results, logtypes );
}

BOOST_AUTO_TEST_CASE( log_no_color_tests )
{
   BOOST_TEST_MESSAGE( "Testing logging library without color" );

   std::vector< std::string > logtypes {
       "<trace>",
       "<debug>",
       "<info>",
       "<warning>",
       "<error>",
       "<fatal>",
       "<unknown>"
   };

   std::vector< std::string > file_lines;
   auto results = capture( false, "trace", file_lines );

   require_levels( results, logtypes );
}

BOOST_AUTO_TEST_CASE( log_level_filter_tests )
{
   BOOST_TEST_MESSAGE( "Testing records below the configured level are dropped" );

   std::vector< std::string > logtypes {
       "<warning>",
       "<error>",
       "<fatal>",
       "<unknown>"
   };

   std::vector< std::string > file_lines;
   auto results = capture( false, "warning", file_lines );

   require_levels( results, logtypes );

   BOOST_REQUIRE( file_lines.size() > 0 );
   auto pos = file_lines[0].find( "<" );
   BOOST_REQUIRE_EQUAL( "<warning>: test", file_lines[0].substr( pos ) );

   BOOST_TEST_MESSAGE( "Testing an unrecognized level falls back to info" );

   file_lines.clear();
   results = capture( false, "verbose", file_lines );

   require_levels( results, { "<info>", "<warning>", "<error>", "<fatal>", "<unknown>" } );
}

BOOST_AUTO_TEST_SUITE_END()
