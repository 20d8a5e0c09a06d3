#ifndef LIBSAFIX_PWD_HEADER
#define LIBSAFIX_PWD_HEADER

#include "path.hpp"

#include <optional>
#include <string>

#include <sys/types.h>

/** \file
 * \brief User database lookups, getpwuid_r and getpwnam_r
 */

namespace sfx {

/// A copy of a struct passwd entry
class SFX_PUBLIC_SYMBOL passwd final
{
public:
	std::string name;
	std::string password;
	std::string gecos;

	/// Home directory
	std::string dir;
	std::string shell;

	uid_t uid{};
	gid_t gid{};
};

/** \brief Looks up a user by ID
 *
 * If there is no such user, success is returned and \c out is set to nullopt.
 */
result SFX_PUBLIC_SYMBOL get_passwd(uid_t uid, std::optional<passwd>& out);

/// Looks up a user by name
result SFX_PUBLIC_SYMBOL get_passwd(path_arg name, std::optional<passwd>& out);

}

#endif
