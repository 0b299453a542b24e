#pragma once

// Compile-time engine configuration. CMake defines CE_RUNTIME_DEBUG (0/1) and, when requested,
// CE_COLOR_DEBUG; both default OFF when this header is used outside the build.
#ifndef CE_RUNTIME_DEBUG
  #define CE_RUNTIME_DEBUG 0
#endif

// Internal invariant check. Reports through ce::log before aborting; compiled out unless
// CE_RUNTIME_DEBUG. Never used for input validation.
#if CE_RUNTIME_DEBUG
  #include <cassert>
  #include <string>
  namespace ce::log { void critical(const std::string&) noexcept; }
  #define CE_ASSERT(expr) \
      do { \
          if(!(expr)) { \
              ::ce::log::critical(std::string("assertion failed: " #expr " at ") + __FILE__ + ":" + std::to_string(__LINE__)); \
              assert(expr); \
          } \
      } while(0)
#else
  #define CE_ASSERT(expr) ((void)0)
#endif
