#include"Ev/Io.hpp"
#include"Node/NodeIF.hpp"
#include"Rescue/BalanceChecker.hpp"
#include"Rescue/StopHandle.hpp"
#include"Rescue/log.hpp"

namespace Rescue {

Ev::Io<void> BalanceChecker::check() {
	return node.list_channels().then([this](std::vector<Node::ChannelDetails> cs) {
		auto channels = std::make_shared<std::vector<Node::ChannelDetails>>(
			std::move(cs)
		);
		return node.list_balances().then([this, channels](Node::BalanceDetails b) {
			auto snap = BalanceSnapshot::compute(*channels, b);
			last_snapshot = std::make_unique<BalanceSnapshot>(snap);
			return Rescue::log( logger, Info
					  , "%s", snap.summary().c_str()
					  ).then([this, snap]() {
				snap.print(out);
				if (!snap.is_complete())
					return Ev::lift();
				return Rescue::log( logger, Info
						  , "no more pending funds, "
						    "stopping the node"
						  ).then([this]() {
					/* Exactly once, even if a later poll
					 * also sees nothing pending.  */
					if (stop.is_stopped())
						return Ev::lift();
					out << "Recovery completed successfully"
					    << std::endl;
					stop.stop();
					return Ev::lift();
				});
			});
		});
	});
}

}
