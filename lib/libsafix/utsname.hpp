#ifndef LIBSAFIX_UTSNAME_HEADER
#define LIBSAFIX_UTSNAME_HEADER

#include "error.hpp"

#include <string>

/** \file
 * \brief System identification through uname
 */

namespace sfx {

class SFX_PUBLIC_SYMBOL utsname_info final
{
public:
	/// Name of the operating system, e.g. "Linux"
	std::string sysname;

	/// Network node name, usually the hostname
	std::string nodename;

	std::string release;
	std::string version;

	/// Hardware identifier, e.g. "x86_64"
	std::string machine;
};

result SFX_PUBLIC_SYMBOL uname(utsname_info& out);

}

#endif
