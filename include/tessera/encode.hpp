#pragma once

#include <tessera/encode/big_integer.hpp>
#include <tessera/encode/error.hpp>
#include <tessera/encode/hex.hpp>
