#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <nlohmann/json.hpp>

#include <fungible/cli/call_script.hpp>
#include <fungible/controller.hpp>
#include <fungible/log.hpp>
#include <fungible/program.hpp>
#include <fungible/util/options.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto help_option               = "help,h"s;
constexpr auto version_option            = "version,v"s;
constexpr auto config_option             = "config,c"s;
constexpr auto config_default            = "fungible.yml"s;
constexpr auto calls_option              = "calls,s"s;
constexpr auto calls_default             = "-"s;
constexpr auto log_level_option          = "log-level,l"s;
constexpr auto log_level_default         = "info"s;
const auto storage_byte_cost_option      = "storage-byte-cost,b"s;
const auto storage_byte_cost_default     = "10000000000000000000"s;

constexpr auto cli_section         = "cli";
constexpr auto global_section      = "global";
constexpr auto genesis_section     = "genesis";
constexpr auto token_section       = "token";
constexpr auto token_account       = "token.near";
constexpr auto token_owner         = "owner.near";
const auto token_total_supply      = "1000000000000000000000000000"s;
const auto genesis_balance         = "1000000000000000000000000000"s;

} // namespace constants

using namespace boost;
using namespace fungible;

const std::string& version_string();

namespace {

struct token_config
{
  protocol::account_id account = constants::token_account;
  protocol::account_id owner   = constants::token_owner;
  protocol::amount_t total_supply;
  std::optional< protocol::token_metadata > metadata;
};

controller::state::genesis_data load_genesis( const YAML::Node& config, const token_config& token )
{
  controller::state::genesis_data data;

  if( config && config[ constants::genesis_section ] )
  {
    for( const auto& entry: config[ constants::genesis_section ] )
    {
      controller::state::genesis_entry genesis;
      genesis.id      = entry[ "id" ].as< std::string >();
      genesis.balance = cli::parse_amount( entry[ "balance" ].as< std::string >() );
      data.emplace_back( std::move( genesis ) );
    }

    return data;
  }

  LOG_WARNING( fungible::log::instance(), "No genesis accounts configured. Using default accounts" );

  for( const auto& id: { token.account, token.owner } )
    data.emplace_back( controller::state::genesis_entry{ .id      = id,
                                                         .balance = cli::parse_amount( constants::genesis_balance ) } );

  return data;
}

token_config load_token( const YAML::Node& config )
{
  token_config token;
  token.total_supply = cli::parse_amount( constants::token_total_supply );

  if( !config || !config[ constants::token_section ] )
    return token;

  const auto& section = config[ constants::token_section ];

  if( section[ "account" ] )
    token.account = section[ "account" ].as< std::string >();

  if( section[ "owner" ] )
    token.owner = section[ "owner" ].as< std::string >();

  if( section[ "total-supply" ] )
    token.total_supply = cli::parse_amount( section[ "total-supply" ].as< std::string >() );

  if( const auto& metadata = section[ "metadata" ]; metadata )
  {
    nlohmann::json value = nlohmann::json::object();
    for( const auto* key: { "spec", "name", "symbol", "icon", "reference", "reference_hash" } )
      if( metadata[ key ] )
        value[ key ] = metadata[ key ].as< std::string >();

    if( metadata[ "decimals" ] )
      value[ "decimals" ] = metadata[ "decimals" ].as< std::uint64_t >();

    token.metadata = cli::metadata_from_json( value );
  }

  return token;
}

nlohmann::ordered_json failure( const std::string& method, const std::string& status, const std::string& error )
{
  nlohmann::ordered_json value;
  value[ "method" ] = method;
  value[ "status" ] = status;
  value[ "error" ]  = error;
  return value;
}

nlohmann::ordered_json execute( controller::controller& controller, const cli::call& call )
{
  auto input = cli::encode_call( call.method, call.args );

  if( call.view )
  {
    auto output = controller.read_program( call.receiver, input );
    if( !output )
      return failure( call.method, "failure", output.error().message() );

    nlohmann::ordered_json value;
    value[ "method" ] = call.method;
    value[ "status" ] = "success";
    value[ "result" ] = cli::decode_result( call.method, *output );
    return value;
  }

  protocol::transaction transaction{ .signer   = call.signer,
                                     .receiver = call.receiver,
                                     .input    = std::move( input ),
                                     .deposit  = call.deposit,
                                     .gas      = call.gas };

  auto receipt = controller.process( transaction );
  if( !receipt )
    return failure( call.method, "rejected", receipt.error().message() );

  return cli::to_json( call.method, *receipt );
}

} // namespace

int main( int argc, char** argv )
{
  std::string log_level, calls_file;
  controller::state::runtime_config runtime;
  token_config token;
  YAML::Node config;

  fungible::log::initialize();

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()             , "Print this help message and exit" )
      ( constants::version_option.data()          , "Print version string and exit" )
      ( constants::config_option.data()           , program_options::value< std::string >(), "The YAML configuration file" )
      ( constants::calls_option.data()            , program_options::value< std::string >(), "The JSON lines call script ('-' reads stdin)" )
      ( constants::log_level_option.data()        , program_options::value< std::string >(), "The log filtering level" )
      ( constants::storage_byte_cost_option.data(), program_options::value< std::string >(), "The native cost of one stored byte" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::cout << version_string() << '\n';
      return EXIT_SUCCESS;
    }

    auto config_file = std::filesystem::path( util::get_option< std::string >( constants::config_option, constants::config_default, args ) );

    YAML::Node global_config;
    YAML::Node cli_config;

    if( std::filesystem::exists( config_file ) )
    {
      config        = YAML::LoadFile( config_file.string() );
      global_config = config[ constants::global_section ];
      cli_config    = config[ constants::cli_section ];
    }

    // clang-format off
    log_level              = util::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, cli_config, global_config );
    calls_file             = util::get_option< std::string >( constants::calls_option, constants::calls_default, args, cli_config, global_config );
    auto storage_byte_cost = util::get_option< std::string >( constants::storage_byte_cost_option, constants::storage_byte_cost_default, args, cli_config, global_config );
    // clang-format on

    fungible::log::set_level( log_level );
    LOG_INFO( fungible::log::instance(), "{}", version_string() );

    if( config.IsNull() )
      LOG_WARNING( fungible::log::instance(), "Could not find config at {}. Using default values", config_file.string() );

    runtime.storage_byte_cost = cli::parse_amount( storage_byte_cost );
    token                     = load_token( config );
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( fungible::log::instance(), "Invalid argument: {}", std::string( e.what() ) );
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;
  controller::controller controller( runtime );

  try
  {
    controller.open( load_genesis( config, token ) );

    if( auto error = controller.deploy( token.account, std::make_shared< program::fungible_token >() ); error )
      throw std::runtime_error( "unable to deploy token: " + error.message() );

    auto initialize = token.metadata ? protocol::encode_all( protocol::ft_instruction::initialize,
                                                             token.owner,
                                                             token.total_supply,
                                                             *token.metadata )
                                     : protocol::encode_all( protocol::ft_instruction::initialize_default_metadata,
                                                             token.owner,
                                                             token.total_supply );

    auto initialized = controller.process( protocol::transaction{ .signer   = token.account,
                                                                  .receiver = token.account,
                                                                  .input    = std::move( initialize ),
                                                                  .deposit  = 0,
                                                                  .gas      = runtime.max_prepaid_gas } );
    if( !initialized )
      throw std::runtime_error( "unable to initialize token: " + initialized.error().message() );

    if( !initialized->successful() )
      throw std::runtime_error( "unable to initialize token: " + initialized->error.message() );

    LOG_INFO( fungible::log::instance(),
              "Initialized token {} owned by {} with supply {}",
              token.account,
              token.owner,
              token.total_supply );

    std::ifstream file;
    if( calls_file != constants::calls_default )
    {
      file.open( calls_file );
      if( !file )
        throw std::runtime_error( "unable to open call script at " + calls_file );
    }

    std::istream& calls = calls_file == constants::calls_default ? std::cin : file;

    std::string line;
    std::size_t line_number = 0;
    while( std::getline( calls, line ) )
    {
      ++line_number;
      if( line.empty() || line.front() == '#' )
        continue;

      try
      {
        auto call = cli::parse_call( line, token.account, runtime.max_prepaid_gas );
        std::cout << execute( controller, call ).dump() << std::endl;
      }
      catch( const std::invalid_argument& e )
      {
        LOG_ERROR( fungible::log::instance(), "Invalid call on line {}: {}", line_number, std::string( e.what() ) );
        std::cout << failure( "", "invalid", e.what() ).dump() << std::endl;
        retcode = EXIT_FAILURE;
      }
    }
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( fungible::log::instance(), "An unexpected error has occurred: {}", std::string( e.what() ) );
    retcode = EXIT_FAILURE;
  }

  controller.close();
  LOG_INFO( fungible::log::instance(), "Shut down gracefully" );

  return retcode;
}

const std::string& version_string()
{
  static std::string v_str = std::string( "Fungible CLI v" ) + FUNGIBLE_VERSION;
  return v_str;
}
