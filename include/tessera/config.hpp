#pragma once

#include <tessera/config/options.hpp>
