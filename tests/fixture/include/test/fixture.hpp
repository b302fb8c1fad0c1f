#pragma once

#include <fungible/controller.hpp>
#include <fungible/program.hpp>
#include <fungible/protocol.hpp>

#include <test/programs.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace test {

namespace account {

inline const fungible::protocol::account_id token    = "token.near";
inline const fungible::protocol::account_id owner    = "owner.near";
inline const fungible::protocol::account_id alice    = "alice.near";
inline const fungible::protocol::account_id bob      = "bob.near";
inline const fungible::protocol::account_id receiver = "receiver.near";
inline const fungible::protocol::account_id plain    = "plain.near";

} // namespace account

/**
 * Returns n whole units of the native currency (24 decimals).
 */
fungible::protocol::amount_t near( std::uint64_t n );

constexpr fungible::protocol::amount_t one_yocto            = 1;
constexpr fungible::protocol::gas_t default_gas             = 300 * fungible::protocol::tera_gas;

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  template< typename... Args >
  std::vector< std::byte > make_input( const Args&... args ) const
  {
    return fungible::protocol::encode_all( args... );
  }

  fungible::protocol::transaction make_transaction( const fungible::protocol::account_id& signer,
                                                    const fungible::protocol::account_id& receiver,
                                                    std::vector< std::byte >&& input,
                                                    const fungible::protocol::amount_t& deposit = 0,
                                                    fungible::protocol::gas_t gas               = default_gas ) const;

  fungible::controller::result< fungible::protocol::transaction_receipt >
  call( const fungible::protocol::account_id& signer,
        std::vector< std::byte >&& input,
        const fungible::protocol::amount_t& deposit = 0,
        fungible::protocol::gas_t gas               = default_gas );

  fungible::controller::result< fungible::protocol::transaction_receipt >
  initialize_token( const fungible::protocol::account_id& owner, const fungible::protocol::amount_t& supply );

  fungible::controller::result< fungible::protocol::transaction_receipt >
  storage_deposit( const fungible::protocol::account_id& payer,
                   const std::optional< fungible::protocol::account_id >& account,
                   const fungible::protocol::amount_t& deposit );

  fungible::controller::result< fungible::protocol::transaction_receipt >
  ft_transfer( const fungible::protocol::account_id& sender,
               const fungible::protocol::account_id& receiver,
               const fungible::protocol::amount_t& amount,
               const std::optional< std::string >& memo = {} );

  fungible::controller::result< fungible::protocol::transaction_receipt >
  ft_transfer_call( const fungible::protocol::account_id& sender,
                    const fungible::protocol::account_id& receiver,
                    const fungible::protocol::amount_t& amount,
                    const std::string& msg,
                    fungible::protocol::gas_t gas                = default_gas,
                    const std::optional< std::string >& memo = {} );

  std::optional< fungible::protocol::amount_t > balance_of( const fungible::protocol::account_id& account ) const;
  fungible::protocol::amount_t total_supply() const;
  fungible::protocol::amount_t storage_bond() const;
  fungible::protocol::amount_t native_balance( const fungible::protocol::account_id& account ) const;

  template< typename T >
  std::optional< T > decode_output( const std::vector< std::byte >& output ) const
  {
    T value{};
    fungible::protocol::decoder decoder( output );
    if( decoder.read( value ) )
      return {};

    return value;
  }

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    without_failure   = 1 << 1,
    without_warning   = 1 << 2
  };

  bool verify( const fungible::controller::result< fungible::protocol::transaction_receipt >& receipt,
               std::uint64_t flags ) const;

  std::unique_ptr< fungible::controller::controller > _controller;
  fungible::controller::state::genesis_data _genesis_data;
};

} // namespace test
