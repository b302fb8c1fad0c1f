#pragma once

#include <string>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace fungible::util {

/**
 * Looks an option up on the command line, then in the section config, then
 * in the global config. Keys may carry a short name ("log-level,l").
 */
template< typename T >
T get_option( const std::string& key,
              const T& default_value,
              const boost::program_options::variables_map& cli_args,
              const YAML::Node& section_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  const auto long_name = key.substr( 0, key.find( ',' ) );

  if( cli_args.count( long_name ) )
    return cli_args[ long_name ].as< T >();

  if( section_config && section_config[ long_name ] )
    return section_config[ long_name ].as< T >();

  if( global_config && global_config[ long_name ] )
    return global_config[ long_name ].as< T >();

  return default_value;
}

} // namespace fungible::util
