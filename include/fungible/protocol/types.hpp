#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace fungible::protocol {

using account_id = std::string;
using amount_t   = boost::multiprecision::uint128_t;
using gas_t      = std::uint64_t;

constexpr gas_t tera_gas = 1'000'000'000'000;

} // namespace fungible::protocol
