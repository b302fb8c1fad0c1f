#pragma once

#include <fungible/state_db/database.hpp>
#include <fungible/state_db/state_node.hpp>
#include <fungible/state_db/types.hpp>
