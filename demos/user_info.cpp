#include <libsafix/grp.hpp>
#include <libsafix/pwd.hpp>
#include <libsafix/unistd.hpp>
#include <libsafix/utsname.hpp>

#include <iostream>
#include <optional>
#include <vector>

int main(int argc, char *argv[])
{
	std::cerr << "Running with uid " << sfx::getuid() << ", euid " << sfx::geteuid() << "\n";

	std::optional<sfx::passwd> pw;
	sfx::result r;
	if (argc > 1) {
		r = sfx::get_passwd(argv[1], pw);
	}
	else {
		r = sfx::get_passwd(sfx::geteuid(), pw);
	}
	if (!r) {
		std::cerr << "Could not look up user: " << sfx::to_string(r) << "\n";
		return 1;
	}
	if (!pw) {
		std::cerr << "No such user\n";
		return 1;
	}

	std::cout << "User:  " << pw->name << " (" << pw->uid << ")\n";
	std::cout << "Home:  " << pw->dir << "\n";
	std::cout << "Shell: " << pw->shell << "\n";

	std::vector<gid_t> groups;
	r = sfx::get_group_list(pw->name, pw->gid, groups);
	if (!r) {
		std::cerr << "Could not get group list: " << sfx::to_string(r) << "\n";
		return 1;
	}

	std::cout << "Groups:";
	for (auto gid : groups) {
		std::optional<sfx::group> g;
		r = sfx::get_group(gid, g);
		if (r && g) {
			std::cout << " " << g->name << "(" << gid << ")";
		}
		else {
			std::cout << " " << gid;
		}
	}
	std::cout << "\n";

	sfx::utsname_info uts;
	r = sfx::uname(uts);
	if (r) {
		std::cout << "Host:  " << uts.nodename << " running " << uts.sysname << " " << uts.release << "\n";
	}

	return 0;
}
