#pragma once

#include <tessera/log/log.hpp>
