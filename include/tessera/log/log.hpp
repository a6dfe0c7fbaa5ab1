#pragma once

#include <quill/LogMacros.h>
#include <quill/core/LogLevel.h>

#include <tessera/log/formatter.hpp>
#include <tessera/log/frontend.hpp>

namespace tessera::log {

void initialize( quill::LogLevel level = quill::LogLevel::Info ) noexcept;
logger* instance() noexcept;

} // namespace tessera::log
