#ifndef RESCUE_WALLETSYNCER_HPP
#define RESCUE_WALLETSYNCER_HPP

namespace Ev { template<typename a> class Io; }
namespace Node { class NodeIF; }
namespace Rescue { class Logger; }

namespace Rescue {

/* Keeps the node engine wallets at the chain tip, so
 * that it notices confirmations of the closing and
 * sweep transactions.  */
class WalletSyncer {
private:
	Node::NodeIF& node;
	Logger& logger;

public:
	WalletSyncer() =delete;
	WalletSyncer(Node::NodeIF& node_, Logger& logger_)
		: node(node_), logger(logger_) { }

	Ev::Io<void> sync();
};

}

#endif /* !defined(RESCUE_WALLETSYNCER_HPP) */
