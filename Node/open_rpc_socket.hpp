#ifndef NODE_OPEN_RPC_SOCKET_HPP
#define NODE_OPEN_RPC_SOCKET_HPP

#include<string>

namespace Net { class Fd; }

namespace Node {

/** Node::open_rpc_socket()
 *
 * @brief changes to the given directory, and
 * connects to the node engine socket there.
 *
 * @desc The socket is named relative to the
 * directory to stay within the `sun_path` limit.
 * Throws std::runtime_error on failure.
 */
Net::Fd open_rpc_socket( std::string const& dir
		       , std::string const& socket_file
		       );

}

#endif /* !defined(NODE_OPEN_RPC_SOCKET_HPP) */
