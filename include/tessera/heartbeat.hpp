#pragma once

#include <tessera/heartbeat/clock.hpp>
#include <tessera/heartbeat/error.hpp>
#include <tessera/heartbeat/peer_liveness.hpp>
#include <tessera/heartbeat/registry.hpp>
