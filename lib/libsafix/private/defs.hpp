#ifndef LIBSAFIX_PRIVATE_DEFS_HEADER
#define LIBSAFIX_PRIVATE_DEFS_HEADER

// Platform detection. libsafix only targets POSIX systems.

#if defined(_WIN32) || defined(_WIN64)
  #error "libsafix wraps POSIX system calls and does not support Windows"
#endif

#if defined(__APPLE__) && defined(__MACH__)
  #ifndef SFX_MAC
    #define SFX_MAC 1
  #endif
#endif

#if defined(__linux__) || defined(__ANDROID__)
  #ifndef SFX_LINUX
    #define SFX_LINUX 1
  #endif
#endif

#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__) || defined(SFX_MAC)
  #ifndef SFX_BSD
    #define SFX_BSD 1
  #endif
#endif

#ifndef SFX_UNIX
  #define SFX_UNIX 1
#endif

#endif
