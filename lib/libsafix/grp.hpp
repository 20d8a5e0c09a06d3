#ifndef LIBSAFIX_GRP_HEADER
#define LIBSAFIX_GRP_HEADER

#include "path.hpp"

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

/** \file
 * \brief Group database lookups
 */

namespace sfx {

/// A copy of a struct group entry
class SFX_PUBLIC_SYMBOL group final
{
public:
	std::string name;
	std::string password;
	gid_t gid{};

	/// Names of the users that have the group as supplementary group
	std::vector<std::string> members;
};

/** \brief Looks up a group by ID
 *
 * If there is no such group, success is returned and \c out is set to nullopt.
 */
result SFX_PUBLIC_SYMBOL get_group(gid_t gid, std::optional<group>& out);

/// Looks up a group by name
result SFX_PUBLIC_SYMBOL get_group(path_arg name, std::optional<group>& out);

/** \brief Gets all groups the user is a member of
 *
 * \c gid is the primary group of the user, usually taken from \ref passwd::gid.
 * It is always part of the returned list.
 */
result SFX_PUBLIC_SYMBOL get_group_list(path_arg user, gid_t gid, std::vector<gid_t>& groups);

}

#endif
