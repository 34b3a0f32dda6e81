#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <sidecar/exception.hpp>
#include <sidecar/log.hpp>
#include <sidecar/sse/exceptions.hpp>
#include <sidecar/sse/sse_data.hpp>
#include <sidecar/sse/stream.hpp>
#include <sidecar/util/options.hpp>

#define SIDECAR_MAJOR_VERSION "1"
#define SIDECAR_MINOR_VERSION "4"
#define SIDECAR_PATCH_VERSION "3"

#define SERVICE_NAME          "sidecar_inspect"

#define HELP_OPTION           "help"
#define VERSION_OPTION        "version"
#define BASEDIR_OPTION        "basedir"
#define INPUT_OPTION          "input"
#define INPUT_DEFAULT         "-"
#define LOG_LEVEL_OPTION      "log-level"
#define LOG_LEVEL_DEFAULT     "info"
#define LOG_COLOR_OPTION      "log-color"
#define LOG_COLOR_DEFAULT     true
#define SKIP_UNKNOWN_OPTION   "skip-unknown"
#define SKIP_UNKNOWN_DEFAULT  false

SIDECAR_DECLARE_EXCEPTION( service_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( invalid_argument, service_exception );

using namespace boost;
using namespace sidecar;

const std::string& version_string();
std::filesystem::path default_base_directory();
uint64_t inspect( std::istream& in, sse::event_stream_reader& reader );

int main( int argc, char** argv )
{
   int retcode = EXIT_SUCCESS;

   try
   {
      program_options::options_description options;
      options.add_options()
         (HELP_OPTION        ",h", "Print this help message and exit")
         (VERSION_OPTION     ",v", "Print version string and exit")
         (BASEDIR_OPTION     ",d", program_options::value< std::string >()->default_value( default_base_directory().string() ),
            "Sidecar base directory")
         (INPUT_OPTION       ",i", program_options::value< std::string >(), "The captured event stream to read, '-' for stdin")
         (LOG_LEVEL_OPTION   ",l", program_options::value< std::string >(), "The log filtering level")
         (LOG_COLOR_OPTION   ",c", program_options::value< bool >(), "Log color toggle")
         (SKIP_UNKNOWN_OPTION",s", program_options::value< bool >(), "Skip events with an unknown variant instead of failing");

      program_options::variables_map args;
      program_options::store( program_options::parse_command_line( argc, argv, options ), args );

      if ( args.count( HELP_OPTION ) )
      {
         std::cout << options << std::endl;
         return EXIT_SUCCESS;
      }

      if ( args.count( VERSION_OPTION ) )
      {
         const auto& v_str = version_string();
         std::cout.write( v_str.c_str(), v_str.size() );
         std::cout << std::endl;
         return EXIT_SUCCESS;
      }

      auto basedir = std::filesystem::path( args[ BASEDIR_OPTION ].as< std::string >() );
      if ( basedir.is_relative() )
         basedir = std::filesystem::current_path() / basedir;

      YAML::Node config;
      YAML::Node global_config;
      YAML::Node inspect_config;

      auto yaml_config = basedir / "config.yml";
      if ( !std::filesystem::exists( yaml_config ) )
      {
         yaml_config = basedir / "config.yaml";
      }

      if ( std::filesystem::exists( yaml_config ) )
      {
         config = YAML::LoadFile( yaml_config.string() );
         global_config = config[ "global" ];
         inspect_config = config[ SERVICE_NAME ];
      }

      auto input        = util::get_option< std::string >( INPUT_OPTION, INPUT_DEFAULT, args, inspect_config, global_config );
      auto log_level    = util::get_option< std::string >( LOG_LEVEL_OPTION, LOG_LEVEL_DEFAULT, args, inspect_config, global_config );
      auto log_color    = util::get_option< bool >( LOG_COLOR_OPTION, LOG_COLOR_DEFAULT, args, inspect_config, global_config );
      auto skip_unknown = util::get_option< bool >( SKIP_UNKNOWN_OPTION, SKIP_UNKNOWN_DEFAULT, args, inspect_config, global_config );

      sidecar::initialize_logging( basedir / SERVICE_NAME / "logs", SERVICE_NAME "_%3N.log", log_level, log_color );

      if ( config.IsNull() )
      {
         LOG(warning) << "Could not find config (config.yml or config.yaml expected). Using default values";
      }

      sse::event_stream_reader reader( skip_unknown );
      uint64_t count = 0;

      if ( input == "-" )
      {
         LOG(info) << "Reading event stream from stdin";
         count = inspect( std::cin, reader );
      }
      else
      {
         auto input_file = std::filesystem::path( input );

         SIDECAR_ASSERT(
            std::filesystem::exists( input_file ),
            invalid_argument,
            "unable to locate event stream at ${loc}", ("loc", input_file.string())
         );

         LOG(info) << "Reading event stream from " << input_file.string();
         std::ifstream ifs( input_file );
         count = inspect( ifs, reader );
      }

      reader.finish();

      std::cout << count << " events";
      if ( reader.skipped() )
         std::cout << ", " << reader.skipped() << " skipped";
      std::cout << std::endl;
   }
   catch ( const invalid_argument& e )
   {
      LOG(error) << "Invalid argument: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const sse::sse_exception& e )
   {
      LOG(error) << "Invalid event stream: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const sidecar::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const boost::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << boost::diagnostic_information( e );
      retcode = EXIT_FAILURE;
   }
   catch ( const std::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( ... )
   {
      LOG(fatal) << "An unexpected error has occurred";
      retcode = EXIT_FAILURE;
   }

   return retcode;
}

const std::string& version_string()
{
   static std::string v_str = "Sidecar inspect v" SIDECAR_MAJOR_VERSION "." SIDECAR_MINOR_VERSION "." SIDECAR_PATCH_VERSION;
   return v_str;
}

std::filesystem::path default_base_directory()
{
   if ( const char* home = std::getenv( "HOME" ) )
      return std::filesystem::path( home ) / ".sidecar";

   return std::filesystem::current_path() / ".sidecar";
}

uint64_t inspect( std::istream& in, sse::event_stream_reader& reader )
{
   uint64_t count = 0;
   std::string chunk( 4096, '\0' );

   while ( in )
   {
      in.read( chunk.data(), chunk.size() );
      auto n = in.gcount();
      if ( n <= 0 )
         break;

      reader.feed( chunk.substr( 0, n ) );

      while ( auto event = reader.next() )
      {
         std::cout << ( event->id ? std::to_string( *event->id ) : std::string( "-" ) ) << " "
                   << sse::to_string( sse::type_of( event->data ) ) << " "
                   << sse::correlation_key( event->data ) << std::endl;
         count++;
      }
   }

   return count;
}
