#pragma once

#include <fungible/encode/base64.hpp>
#include <fungible/encode/error.hpp>
