#include "libsafix/dirent.hpp"
#include "libsafix/recursive_remove.hpp"
#include "libsafix/stat.hpp"
#include "libsafix/unistd.hpp"

namespace sfx {

recursive_remove::recursive_remove()
	: logger_(null_logger_)
{
}

recursive_remove::recursive_remove(logger_interface& logger)
	: logger_(logger)
{
}

result recursive_remove::remove(path_arg path)
{
	std::list<std::string> paths;
	paths.emplace_back(path.bytes());
	return remove(std::move(paths));
}

result recursive_remove::remove(std::list<std::string> dirsToVisit)
{
	if (!confirm()) {
		return {result::other, ECANCELED};
	}

	result ret{result::ok};
	auto fail = [&](char const* what, std::string const& path, result const& r) {
		logger_.log(logmsg::error, "Could not %s %s: %s", what, path, to_string(r));
		if (ret) {
			ret = r;
		}
	};

	for (auto& p : dirsToVisit) {
		if (p.size() > 1 && p.back() == '/') {
			p.pop_back();
		}
	}

	// Remember the directories to delete after recursing into them
	std::list<std::string> dirsToDelete;

	// Process all directories that have to be visited
	while (!dirsToVisit.empty()) {
		auto const iter = dirsToVisit.begin();
		std::string const& path = *iter;

		if (path.empty()) {
			dirsToVisit.erase(iter);
			continue;
		}

		stat_info st;
		auto r = lstat(path, st);
		if (!r) {
			fail("stat", path, r);
			dirsToVisit.erase(iter);
			continue;
		}

		if (!st.is_dir()) {
			r = unlink(path);
			if (!r) {
				fail("delete", path, r);
			}
			dirsToVisit.erase(iter);
			continue;
		}

		dirsToDelete.splice(dirsToDelete.begin(), dirsToVisit, iter);

		dir d;
		r = d.open(path);
		if (!r) {
			fail("open directory", path, r);
			continue;
		}

		// Modifying a directory while reading it may skip or repeat entries,
		// only delete once everything in it has been enumerated.
		std::list<std::string> filesToDelete;

		while (true) {
			dir_entry entry;
			bool end{};
			r = d.read(entry, end);
			if (!r) {
				fail("read directory", path, r);
				break;
			}
			if (end) {
				break;
			}

			auto const name = entry.name();
			if (name == "." || name == "..") {
				continue;
			}

			std::string fullName = path;
			if (fullName.back() != '/') {
				fullName += '/';
			}
			fullName += name;

			file_type type = to_file_type(entry.type());
			if (type == file_type::unknown) {
				stat_info est;
				if (d.fstatat(name, est, at_flag::symlink_nofollow)) {
					type = est.type();
				}
			}

			if (type == file_type::directory) {
				dirsToVisit.push_back(std::move(fullName));
			}
			else {
				filesToDelete.push_back(std::move(fullName));
			}
		}
		d.close();

		// Delete all files and links in current directory enumerated before
		for (auto const& filename : filesToDelete) {
			r = unlinkat(at_fdcwd, filename);
			if (!r) {
				fail("delete", filename, r);
			}
		}
	}

	// Delete the now empty directories
	for (auto const& p : dirsToDelete) {
		auto r = rmdir(p);
		if (!r) {
			fail("remove directory", p, r);
		}
	}

	return ret;
}

}
