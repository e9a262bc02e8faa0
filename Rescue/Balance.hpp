#ifndef RESCUE_BALANCE_HPP
#define RESCUE_BALANCE_HPP

#include<cstdint>
#include<ostream>
#include<string>
#include<utility>
#include<vector>

namespace Node { struct BalanceDetails; }
namespace Node { struct ChannelDetails; }
namespace Node { struct LightningBalance; }
namespace Node { struct PendingSweepBalance; }

namespace Rescue {

/* The channel a balance belongs to (empty if unknown)
 * and its amount in satoshis.  */
std::pair<std::string, std::uint64_t>
channel_amount(Node::LightningBalance const&);
std::pair<std::string, std::uint64_t>
channel_amount(Node::PendingSweepBalance const&);

/** struct Rescue::BalanceSnapshot
 *
 * @brief where the recovered funds are, as of one
 * poll of the node engine.
 */
struct BalanceSnapshot {
	std::uint64_t spendable;
	/* On-chain total less the anchor reserve, never
	 * below zero.  */
	std::uint64_t total;
	std::uint64_t reserved;
	/* Lightning balances of channels the node engine
	 * no longer lists, i.e. closed ones.  */
	std::uint64_t claimable;
	std::uint64_t pending_sweep;

	/* Sums here saturate instead of wrapping, so
	 * absurd amounts never look like zero.  */
	std::uint64_t pending() const;
	bool is_complete() const {
		return pending() == 0;
	}

	static BalanceSnapshot compute( std::vector<Node::ChannelDetails> const&
				      , Node::BalanceDetails const&
				      );

	/* Single line, for the log.  */
	std::string summary() const;
	/* Multi-line, for the user.  */
	void print(std::ostream&) const;
};

}

#endif /* !defined(RESCUE_BALANCE_HPP) */
