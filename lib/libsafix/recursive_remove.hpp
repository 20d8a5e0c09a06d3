#ifndef LIBSAFIX_RECURSIVE_REMOVE_HEADER
#define LIBSAFIX_RECURSIVE_REMOVE_HEADER

#include "error.hpp"
#include "logger.hpp"
#include "path.hpp"

#include <list>
#include <string>

/// \file
/// \brief Class to recursively delete directories

namespace sfx {

/** \brief Recursively deletes directories.
 *
 * Symlinks are removed, never followed. Removal continues past errors,
 * each failure is logged as logmsg::error and the first one is returned.
 */
class SFX_PUBLIC_SYMBOL recursive_remove
{
public:
	/// Errors are not logged
	recursive_remove();

	explicit recursive_remove(logger_interface& logger);

	virtual ~recursive_remove() = default;

	recursive_remove(recursive_remove const&) = delete;
	recursive_remove& operator=(recursive_remove const&) = delete;

	/// \brief Removes given file or directory
	result remove(path_arg path);

	/// \brief Removes given files and directories
	result remove(std::list<std::string> dirsToVisit);

protected:
	/// \brief Can be overridden to ask the user for a confirmation.
	///
	/// If it returns false, nothing is removed and ECANCELED is returned.
	virtual bool confirm() const { return true; }

private:
	null_logger null_logger_;
	logger_interface& logger_;
};

}

#endif
