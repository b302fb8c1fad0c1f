#pragma once

#include <fungible/program/error.hpp>
#include <fungible/program/fungible_token.hpp>
#include <fungible/program/ledger.hpp>
#include <fungible/program/metadata.hpp>
#include <fungible/program/program.hpp>
#include <fungible/program/system_interface.hpp>
