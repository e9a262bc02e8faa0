#ifndef RESCUE_BALANCECHECKER_HPP
#define RESCUE_BALANCECHECKER_HPP

#include"Rescue/Balance.hpp"
#include<memory>
#include<ostream>

namespace Ev { template<typename a> class Io; }
namespace Node { class NodeIF; }
namespace Rescue { class Logger; }
namespace Rescue { class StopHandle; }

namespace Rescue {

/** class Rescue::BalanceChecker
 *
 * @brief polls the node engine balances, reports
 * them, and stops everything once nothing is left
 * pending from the closed channels.
 */
class BalanceChecker {
private:
	Node::NodeIF& node;
	Logger& logger;
	std::ostream& out;
	StopHandle& stop;

	std::unique_ptr<BalanceSnapshot> last_snapshot;

public:
	BalanceChecker() =delete;
	BalanceChecker( Node::NodeIF& node_
		      , Logger& logger_
		      , std::ostream& out_
		      , StopHandle& stop_
		      ) : node(node_)
			, logger(logger_)
			, out(out_)
			, stop(stop_)
			{ }

	/* One poll.  */
	Ev::Io<void> check();

	/* nullptr before the first successful poll.  */
	BalanceSnapshot const* last() const {
		return last_snapshot.get();
	}
};

}

#endif /* !defined(RESCUE_BALANCECHECKER_HPP) */
