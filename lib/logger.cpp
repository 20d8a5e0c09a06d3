#include "libsafix/logger.hpp"

#include <stdio.h>

namespace sfx {

char const* logmsg_name(logmsg::type t)
{
	switch (t) {
	case logmsg::status:
		return "status";
	case logmsg::error:
		return "error";
	case logmsg::command:
		return "command";
	case logmsg::reply:
		return "reply";
	case logmsg::debug_warning:
		return "warning";
	case logmsg::debug_info:
		return "info";
	case logmsg::debug_verbose:
		return "verbose";
	case logmsg::debug_debug:
		return "debug";
	default:
		return "log";
	}
}

void stderr_logger::do_log(logmsg::type t, std::string && msg)
{
	// One write per line, so concurrent messages do not interleave
	std::string line = sfx::sprintf("%s: %s\n", logmsg_name(t), msg);
	fwrite(line.data(), 1, line.size(), stderr);
}

}
