#include"Net/Fd.hpp"
#include"Node/open_rpc_socket.hpp"
#include"Util/BacktraceException.hpp"
#include<errno.h>
#include<stdexcept>
#include<string.h>
#include<sys/socket.h>
#include<sys/types.h>
#include<sys/un.h>
#include<unistd.h>

namespace Node {

Net::Fd open_rpc_socket( std::string const& dir
		       , std::string const& socket_file
		       ) {
	auto chdir_res = chdir(dir.c_str());
	if (chdir_res < 0)
		throw Util::BacktraceException<std::runtime_error>(
			"chdir " + dir + ": " + strerror(errno)
		);

	auto fd = Net::Fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
	if (!fd)
		throw Util::BacktraceException<std::runtime_error>(
			std::string("socket: ") + strerror(errno)
		);

	auto addr = sockaddr_un();
	if (socket_file.length() + 1 > sizeof(addr.sun_path))
		throw Util::BacktraceException<std::runtime_error>(
			socket_file + ": " + strerror(ENAMETOOLONG)
		);

	strcpy(addr.sun_path, socket_file.c_str());
	addr.sun_family = AF_UNIX;

	auto connect_res = int();
	do {
		connect_res = connect( fd.get()
				     , reinterpret_cast<sockaddr const*>(&addr)
				     , sizeof(addr)
				     );
	} while (connect_res < 0 && errno == EINTR);
	if (connect_res < 0)
		throw Util::BacktraceException<std::runtime_error>(
			"connect " + socket_file + ": " + strerror(errno)
			+ " (is the node engine running?)"
		);

	return fd;
}

}
