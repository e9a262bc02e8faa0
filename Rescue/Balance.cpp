#include"Node/Types.hpp"
#include"Rescue/Balance.hpp"
#include"Util/Str.hpp"
#include<inttypes.h>
#include<limits>
#include<set>

namespace {

std::uint64_t add_sats(std::uint64_t a, std::uint64_t b) {
	auto max = std::numeric_limits<std::uint64_t>::max();
	if (a > max - b)
		return max;
	return a + b;
}

}

namespace Rescue {

std::pair<std::string, std::uint64_t>
channel_amount(Node::LightningBalance const& b) {
	switch (b.kind) {
	case Node::LightningBalance::ClaimableOnChannelClose:
	case Node::LightningBalance::ClaimableAwaitingConfirmations:
	case Node::LightningBalance::ContentiousClaimable:
	case Node::LightningBalance::MaybeTimeoutClaimableHTLC:
	case Node::LightningBalance::MaybePreimageClaimableHTLC:
	case Node::LightningBalance::CounterpartyRevokedOutputClaimable:
		return std::make_pair(b.channel_id, b.amount_satoshis);
	}
	return std::make_pair(b.channel_id, b.amount_satoshis);
}

std::pair<std::string, std::uint64_t>
channel_amount(Node::PendingSweepBalance const& b) {
	switch (b.kind) {
	case Node::PendingSweepBalance::PendingBroadcast:
	case Node::PendingSweepBalance::BroadcastAwaitingConfirmation:
	case Node::PendingSweepBalance::AwaitingThresholdConfirmations:
		return std::make_pair(b.channel_id, b.amount_satoshis);
	}
	return std::make_pair(b.channel_id, b.amount_satoshis);
}

BalanceSnapshot
BalanceSnapshot::compute( std::vector<Node::ChannelDetails> const& channels
			, Node::BalanceDetails const& balances
			) {
	auto open = std::set<std::string>();
	for (auto const& c : channels)
		open.insert(c.channel_id);

	auto ret = BalanceSnapshot();
	ret.spendable = balances.spendable_onchain_balance_sats;
	ret.reserved = balances.total_anchor_channels_reserve_sats;
	if (balances.total_onchain_balance_sats > ret.reserved)
		ret.total = balances.total_onchain_balance_sats - ret.reserved;
	else
		ret.total = 0;

	ret.claimable = 0;
	for (auto const& b : balances.lightning_balances) {
		auto ca = channel_amount(b);
		if (open.count(ca.first) == 0)
			ret.claimable = add_sats(ret.claimable, ca.second);
	}

	ret.pending_sweep = 0;
	for (auto const& b : balances.pending_balances_from_channel_closures)
		ret.pending_sweep = add_sats( ret.pending_sweep
					    , channel_amount(b).second
					    );

	return ret;
}

std::uint64_t BalanceSnapshot::pending() const {
	return add_sats(claimable, pending_sweep);
}

std::string BalanceSnapshot::summary() const {
	return Util::Str::fmt( "balances: spendable: %" PRIu64
			       ", reserved: %" PRIu64
			       ", claimable: %" PRIu64
			       ", pending sweep: %" PRIu64
			     , spendable, reserved, claimable, pending_sweep
			     );
}

void BalanceSnapshot::print(std::ostream& os) const {
	os << "Balances (sats):" << std::endl
	   << "  Spendable: " << spendable
	   << "; total: " << total
	   << "; reserved: " << reserved << std::endl
	   << "  Pending from channel closures: " << pending() << std::endl
	   << std::endl
	   ;
}

}
