#include"Rescue/paths.hpp"
#include"Util/BacktraceException.hpp"
#include<errno.h>
#include<limits.h>
#include<stdexcept>
#include<stdlib.h>
#include<string.h>
#include<unistd.h>
#include<vector>

namespace Rescue {

char const* const log_file = "chanrescue.log";
char const* const state_file = "chanrescue.state";
char const* const node_data_dir = "ldk_data";

std::pair<std::string, std::string> split_path(std::string const& path) {
	auto slash = path.rfind('/');
	if (slash == std::string::npos)
		return std::make_pair(std::string("."), path);
	if (slash == 0)
		return std::make_pair(std::string("/"), path.substr(1));
	return std::make_pair(path.substr(0, slash), path.substr(slash + 1));
}

std::string resolve(std::string const& dir, std::string const& path) {
	if (!path.empty() && path[0] == '/')
		return path;
	if (dir.empty() || dir[dir.size() - 1] == '/')
		return dir + path;
	return dir + "/" + path;
}

std::string own_dir(std::string const& argv0) {
	auto buf = std::vector<char>(PATH_MAX + 1);
	auto len = readlink("/proc/self/exe", &buf[0], PATH_MAX);
	if (len > 0)
		return split_path(std::string(&buf[0], std::size_t(len))).first;

	/* No procfs.  */
	auto resolved = realpath(argv0.c_str(), &buf[0]);
	if (!resolved)
		throw Util::BacktraceException<std::runtime_error>(
			"failed to get own executable directory: "
			+ std::string(strerror(errno))
		);
	return split_path(std::string(resolved)).first;
}

}
