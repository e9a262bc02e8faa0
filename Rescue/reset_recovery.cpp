#include"Rescue/paths.hpp"
#include"Rescue/reset_recovery.hpp"
#include"Util/BacktraceException.hpp"
#include<errno.h>
#include<ftw.h>
#include<stdexcept>
#include<stdio.h>
#include<string.h>
#include<unistd.h>

namespace {

int remove_entry(char const* path, struct stat const*, int, struct FTW*) {
	return remove(path);
}

std::string failed(std::string const& what, std::string const& path) {
	return "failed to delete " + what + " " + path + ": " + strerror(errno);
}

}

namespace Rescue {

void reset_recovery(std::string const& dir) {
	auto state = resolve(dir, state_file);
	if (unlink(state.c_str()) < 0 && errno != ENOENT)
		throw Util::BacktraceException<std::runtime_error>(
			failed("recovery state file", state)
		);

	auto data = resolve(dir, node_data_dir);
	/* Children before their directory; do not follow
	 * symlinks out of the tree.  */
	if ( nftw(data.c_str(), &remove_entry, 16, FTW_DEPTH | FTW_PHYS) != 0
	  && errno != ENOENT
	   )
		throw Util::BacktraceException<std::runtime_error>(
			failed("node data directory", data)
		);
}

}
