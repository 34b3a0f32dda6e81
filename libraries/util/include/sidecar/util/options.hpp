#pragma once

#include <string>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace sidecar::util {

/**
 * Resolves an option from, in order of precedence, the command line, the
 * service section of the config file, the global section and finally the default.
 */
template< typename T >
T get_option(
   const std::string& key,
   T default_value,
   const boost::program_options::variables_map& cli_args,
   const YAML::Node& service_config = YAML::Node(),
   const YAML::Node& global_config = YAML::Node() )
{
   if ( cli_args.count( key ) )
      return cli_args[ key ].as< T >();

   if ( service_config && service_config[ key ] )
      return service_config[ key ].as< T >();

   if ( global_config && global_config[ key ] )
      return global_config[ key ].as< T >();

   return default_value;
}

} // sidecar::util
