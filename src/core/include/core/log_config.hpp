#pragma once
#include <string>

// Central logging configuration / helper macros.
// Define EK_TIMELINE_DEBUG or EK_DISPATCH_DEBUG (e.g. via compiler flags) to enable verbose logs.

namespace ek { namespace log { void debug(const std::string&) noexcept; } }

#if defined(EK_TIMELINE_DEBUG)
  #define EK_TL_DEBUG(msg) ::ek::log::debug(msg)
#else
  #define EK_TL_DEBUG(msg) do {} while(0)
#endif

#if defined(EK_DISPATCH_DEBUG)
  #define EK_DISPATCH_LOG(msg) ::ek::log::debug(msg)
#else
  #define EK_DISPATCH_LOG(msg) do {} while(0)
#endif
