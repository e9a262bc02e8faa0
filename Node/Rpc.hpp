#ifndef NODE_RPC_HPP
#define NODE_RPC_HPP

#include"Jsmn/Object.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Json { class Out; }
namespace Net { class Fd; }
namespace Rescue { class Logger; }

namespace Node {

/* The node engine answered a command with an error.  */
struct RpcError : public Util::BacktraceException<std::runtime_error> {
private:
	static
	std::string make_error_message( std::string const&
				      , Jsmn::Object const&
				      );
public:
	RpcError() =delete;
	explicit
	RpcError(std::string command, Jsmn::Object error);

	std::string command;
	Jsmn::Object error;
};

/* The RPC socket was closed, by us or by the other end,
 * while a command was outstanding.  */
struct RpcClosed : public Util::BacktraceException<std::runtime_error> {
	explicit
	RpcClosed(std::string const& why)
		: Util::BacktraceException<std::runtime_error>(
			"node engine RPC closed: " + why
		  ) { }
};

/** class Node::Rpc
 *
 * @brief JSON-RPC 2.0 client over a stream socket.
 *
 * @desc Requests are written as they are issued and
 * responses are matched to them by id, so any number
 * of commands may be outstanding.
 * Traffic is logged at Debug level.
 */
class Rpc {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	Rpc(Rescue::Logger& logger, Net::Fd socket);
	Rpc(Rpc&&);
	~Rpc();

	/* With `sensitive`, params are not logged.  */
	Ev::Io<Jsmn::Object> command( std::string const& command
				    , Json::Out params
				    , bool sensitive = false
				    );

	/* Fails all outstanding commands with RpcClosed and
	 * stops reading.  Later commands fail immediately.  */
	void shutdown();
};

}

#endif /* !defined(NODE_RPC_HPP) */
