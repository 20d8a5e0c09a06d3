#ifndef LIBSAFIX_PRIVATE_VISIBILITY_HEADER
#define LIBSAFIX_PRIVATE_VISIBILITY_HEADER

#include "../visibility_helper.hpp"

// Symbol visibility. There are two main cases: Building libsafix and using it
#ifdef BUILDING_LIBSAFIX
  #define SFX_PUBLIC_SYMBOL SFX_EXPORT_PUBLIC
  #define SFX_PRIVATE_SYMBOL SFX_EXPORT_PRIVATE
#else
  #define SFX_PRIVATE_SYMBOL
  #define SFX_PUBLIC_SYMBOL SFX_IMPORT
#endif

#endif
