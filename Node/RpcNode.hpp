#ifndef NODE_RPCNODE_HPP
#define NODE_RPCNODE_HPP

#include"Node/NodeIF.hpp"
#include<memory>
#include<string>

namespace Net { class Fd; }
namespace Rescue { class Logger; }

namespace Node {

/* What the node engine needs to know at `start`.  */
struct RpcNodeConfig {
	/* bitcoin, testnet, signet or regtest.  */
	std::string network;
	std::string esplora_server;
	std::string storage_dir;
	/* Never logged.  */
	std::string seed_phrase;
};

/** class Node::RpcNode
 *
 * @brief Node::NodeIF implemented by a node engine
 * daemon listening on a local JSON-RPC socket.
 *
 * @desc Method names are the NodeIF operation names.
 */
class RpcNode : public NodeIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	RpcNode() =delete;
	RpcNode( Rescue::Logger& logger
	       , Net::Fd socket
	       , RpcNodeConfig config
	       );
	RpcNode(RpcNode&&);
	~RpcNode() override;

	Ev::Io<void>
	restore_encoded_channel_monitors(std::vector<Scb::EncodedMonitor>) override;
	Ev::Io<void> start() override;
	Ev::Io<void> stop() override;
	Ev::Io<void> sync_wallets() override;
	Ev::Io<void> connect( Ln::NodeId const& peer
			    , std::string const& address
			    , bool persist
			    ) override;
	Ev::Io<std::vector<ChannelDetails>> list_channels() override;
	Ev::Io<BalanceDetails> list_balances() override;
	Ev::Io<void> force_close_all_channels_without_broadcasting_txn() override;
	Ev::Io<std::unique_ptr<Event>> next_event() override;
	Ev::Io<void> event_handled() override;
};

}

#endif /* !defined(NODE_RPCNODE_HPP) */
