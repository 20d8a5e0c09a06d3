#ifndef LIBSAFIX_VISIBILITY_HELPER_HEADER
#define LIBSAFIX_VISIBILITY_HELPER_HEADER

/** \file
 * \brief Helper macros for symbol visibility in shared libraries
 *
 * For building, public symbols get default visibility and everything else
 * is hidden. Users of the library import symbols without annotation.
 *
 * Usage example:
 * \code
 * #include <libsafix/visibility_helper.hpp>
 * #ifdef BUILDING_LIBRARY // Provide this yourself
 *   #define PUBLIC_SYMBOL SFX_EXPORT_PUBLIC
 *   #define PRIVATE_SYMBOL SFX_EXPORT_PRIVATE
 * #else
 *   #define PUBLIC_SYMBOL SFX_IMPORT
 *   #define PRIVATE_SYMBOL
 * #endif
 *
 * struct PUBLIC_SYMBOL example {
 *   void do_stuff();
 *   void PRIVATE_SYMBOL for_internal_use();
 * };
 * \endcode
 */

#ifdef DOXYGEN
/// Marks symbols as public to be exported
#define SFX_EXPORT_PUBLIC

/// Marks symbols as private, they won't be exported
#define SFX_EXPORT_PRIVATE

/// Import symbols from the library
#define SFX_IMPORT

#else

#include "private/defs.hpp"

#define SFX_EXPORT_PUBLIC __attribute__((visibility("default")))
#define SFX_EXPORT_PRIVATE __attribute__((visibility("hidden")))
#define SFX_IMPORT

#endif

#endif
