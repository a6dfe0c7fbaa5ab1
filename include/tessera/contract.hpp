#pragma once

#include <tessera/contract/epoch_notifier.hpp>
#include <tessera/contract/error.hpp>
#include <tessera/contract/esdt.hpp>
#include <tessera/contract/esdt_state.hpp>
#include <tessera/contract/system_contract.hpp>
#include <tessera/contract/system_interface.hpp>
#include <tessera/contract/types.hpp>
