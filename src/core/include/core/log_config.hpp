#pragma once
#include <string>

// Pipeline tracing. Build with -DCE_COLOR_DEBUG=ON to log conversion routes and gamut mapping
// decisions at debug level (also needs CE_LOG_LEVEL=debug at runtime). The message expression
// is not evaluated when tracing is compiled out.

namespace ce { namespace log { void debug(const std::string&) noexcept; } }

#if defined(CE_COLOR_DEBUG) && CE_COLOR_DEBUG
  #define CE_COLOR_TRACE(msg) ::ce::log::debug(msg)
#else
  #define CE_COLOR_TRACE(msg) do {} while(0)
#endif
