#ifndef NODE_NODEIF_HPP
#define NODE_NODEIF_HPP

#include"Node/Types.hpp"
#include<memory>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Ln { class NodeId; }
namespace Scb { struct EncodedMonitor; }

namespace Node {

/** class Node::NodeIF
 *
 * @brief abstract interface to the node engine that
 * does the actual Lightning work: channel force-close,
 * HTLC claims, sweeps.
 *
 * @desc Every operation may fail with an exception,
 * usually Node::RpcError or Node::BadResult.
 */
class NodeIF {
public:
	virtual ~NodeIF() { }

	/** Node::NodeIF::restore_encoded_channel_monitors
	 *
	 * @brief hands the channel monitors from a backup
	 * to the node engine.
	 * Must be called before `start`, and only when
	 * recovery starts from scratch.
	 */
	virtual
	Ev::Io<void>
	restore_encoded_channel_monitors(std::vector<Scb::EncodedMonitor>) =0;

	virtual
	Ev::Io<void> start() =0;
	virtual
	Ev::Io<void> stop() =0;

	/** Node::NodeIF::sync_wallets
	 *
	 * @brief brings the on-chain and Lightning
	 * wallets up to the chain tip.
	 */
	virtual
	Ev::Io<void> sync_wallets() =0;

	/** Node::NodeIF::connect
	 *
	 * @brief connects to the peer at the given
	 * `host:port`.
	 * With `persist`, the node engine keeps
	 * reconnecting on its own.
	 */
	virtual
	Ev::Io<void> connect( Ln::NodeId const& peer
			    , std::string const& address
			    , bool persist
			    ) =0;

	virtual
	Ev::Io<std::vector<ChannelDetails>> list_channels() =0;
	virtual
	Ev::Io<BalanceDetails> list_balances() =0;

	/** Node::NodeIF::force_close_all_channels_without_broadcasting_txn
	 *
	 * @brief asks every peer to force-close, without
	 * broadcasting our own (possibly stale) commitment.
	 */
	virtual
	Ev::Io<void> force_close_all_channels_without_broadcasting_txn() =0;

	/** Node::NodeIF::next_event
	 *
	 * @brief returns the next unhandled event, or
	 * nullptr if there is none.
	 * The same event is returned until `event_handled`
	 * is called.
	 */
	virtual
	Ev::Io<std::unique_ptr<Event>> next_event() =0;
	virtual
	Ev::Io<void> event_handled() =0;
};

}

#endif /* !defined(NODE_NODEIF_HPP) */
