#pragma once

#include <fungible/protocol/abi.hpp>
#include <fungible/protocol/account.hpp>
#include <fungible/protocol/codec.hpp>
#include <fungible/protocol/error.hpp>
#include <fungible/protocol/event.hpp>
#include <fungible/protocol/text.hpp>
#include <fungible/protocol/transaction.hpp>
#include <fungible/protocol/types.hpp>
