#pragma once

#include <tessera/vm/error.hpp>
#include <tessera/vm/gas_meter.hpp>
#include <tessera/vm/system_context.hpp>
#include <tessera/vm/system_vm.hpp>
#include <tessera/vm/types.hpp>
