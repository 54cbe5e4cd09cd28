#pragma once

#include <string>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace setmint::config {

/**
 * Looks an option up on the command line, then in the service section of the
 * config file, then in its global section. The first hit wins.
 *
 * Keys may carry a short form ("log-level,l"), which is ignored here.
 */
template< typename T >
T get_option( std::string key,
              T default_value,
              const boost::program_options::variables_map& cli_args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  if( auto pos = key.find( ',' ); pos != std::string::npos )
    key.resize( pos );

  if( cli_args.count( key ) )
    return cli_args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

} // namespace setmint::config
