#ifndef LIBSAFIX_STDLIB_HEADER
#define LIBSAFIX_STDLIB_HEADER

#include "fcntl.hpp"
#include "file_desc.hpp"

#include <optional>
#include <string>

/** \file
 * \brief Functions from stdlib.h: path resolution, randomness, pseudoterminals and the environment
 */

namespace sfx {

/// Resolves path to an absolute path without symlinks, "." or ".." components
result SFX_PUBLIC_SYMBOL realpath(path_arg path, std::string& out);

/// Flags for \ref getrandom
enum class random_flag
{
	none = 0,

	/// Fail with EAGAIN instead of blocking if the entropy pool is not yet initialized
	nonblock = 1,

	/// Draw from the random source instead of the urandom source
	random = 2
};
SFX_ENUM_FLAG_OPERATORS(random_flag)

/** \brief Fills buf with random bytes from the kernel
 *
 * \c written may be less than \c len. Fails with ENOSYS where unsupported.
 */
result SFX_PUBLIC_SYMBOL getrandom(void* buf, size_t len, random_flag flags, size_t& written);

/** \brief Fills buf completely with random bytes
 *
 * At most 256 bytes can be requested at once, larger requests fail.
 * Fails with ENOSYS where unsupported.
 */
result SFX_PUBLIC_SYMBOL getentropy(void* buf, size_t len);

/// Opens a new pseudoterminal master. Pass oflag::read_write, usually together with oflag::noctty.
result SFX_PUBLIC_SYMBOL posix_openpt(file_desc& master, oflag flags);

result SFX_PUBLIC_SYMBOL grantpt(int master);
result SFX_PUBLIC_SYMBOL unlockpt(int master);

/// Gets the path of the slave device belonging to the pseudoterminal master
result SFX_PUBLIC_SYMBOL ptsname(int master, std::string& out);

/** \brief Reads an environment variable
 *
 * Sets value to nullopt if the variable is not set.
 *
 * \ref getenv, \ref setenv and \ref unsetenv serialize against each other,
 * but not against other code accessing the environment directly.
 */
result SFX_PUBLIC_SYMBOL getenv(path_arg name, std::optional<std::string>& value);

/// Fails with EINVAL if name is empty or contains '='
result SFX_PUBLIC_SYMBOL setenv(path_arg name, path_arg value, bool overwrite = true);
result SFX_PUBLIC_SYMBOL unsetenv(path_arg name);

}

#endif
