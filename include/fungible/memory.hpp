#pragma once

#include <fungible/memory/memory.hpp>
