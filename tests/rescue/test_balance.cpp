#undef NDEBUG
#include"Node/Types.hpp"
#include"Rescue/Balance.hpp"
#include<assert.h>
#include<cstdint>
#include<limits>
#include<sstream>

namespace {

Node::ChannelDetails open_channel(std::string const& id) {
	auto c = Node::ChannelDetails();
	c.channel_id = id;
	c.counterparty_node_id = "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
	c.channel_value_sats = 100000;
	c.is_usable = false;
	return c;
}

Node::LightningBalance lightning( Node::LightningBalance::Kind k
				, std::string const& id
				, std::uint64_t amount
				) {
	auto b = Node::LightningBalance();
	b.kind = k;
	b.channel_id = id;
	b.amount_satoshis = amount;
	return b;
}

Node::PendingSweepBalance sweep( Node::PendingSweepBalance::Kind k
			       , std::uint64_t amount
			       ) {
	auto b = Node::PendingSweepBalance();
	b.kind = k;
	b.amount_satoshis = amount;
	return b;
}

}

int main() {
	auto details = Node::BalanceDetails();
	details.total_onchain_balance_sats = 50000;
	details.spendable_onchain_balance_sats = 40000;
	details.total_anchor_channels_reserve_sats = 10000;
	details.lightning_balances = {
		/* Still listed as open: not counted.  */
		lightning(Node::LightningBalance::ClaimableOnChannelClose, "open1", 70000),
		lightning(Node::LightningBalance::ClaimableAwaitingConfirmations, "closed1", 30000),
		lightning(Node::LightningBalance::MaybeTimeoutClaimableHTLC, "closed2", 500)
	};
	details.pending_balances_from_channel_closures = {
		sweep(Node::PendingSweepBalance::BroadcastAwaitingConfirmation, 29000),
		sweep(Node::PendingSweepBalance::AwaitingThresholdConfirmations, 1000)
	};

	auto s = Rescue::BalanceSnapshot::compute({open_channel("open1")}, details);
	assert(s.spendable == 40000);
	assert(s.total == 40000);
	assert(s.reserved == 10000);
	assert(s.claimable == 30500);
	assert(s.pending_sweep == 30000);
	assert(s.pending() == 60500);
	assert(!s.is_complete());

	assert(s.summary() == "balances: spendable: 40000, reserved: 10000, claimable: 30500, pending sweep: 30000");

	auto os = std::ostringstream();
	s.print(os);
	assert(os.str() ==
		"Balances (sats):\n"
		"  Spendable: 40000; total: 40000; reserved: 10000\n"
		"  Pending from channel closures: 60500\n"
		"\n");

	/* Reserve larger than the on-chain total.  */
	details.total_onchain_balance_sats = 5000;
	details.lightning_balances.clear();
	details.pending_balances_from_channel_closures.clear();
	s = Rescue::BalanceSnapshot::compute({}, details);
	assert(s.total == 0);
	assert(s.is_complete());

	/* Once the channel is no longer listed its balance counts.  */
	details.lightning_balances = {
		lightning(Node::LightningBalance::ContentiousClaimable, "open1", 70000)
	};
	s = Rescue::BalanceSnapshot::compute({open_channel("open1")}, details);
	assert(s.is_complete());
	s = Rescue::BalanceSnapshot::compute({}, details);
	assert(s.claimable == 70000);

	/* Amounts adding up past 2^64 stay pending.  */
	{
		auto max = std::numeric_limits<std::uint64_t>::max();
		details.lightning_balances = {
			lightning(Node::LightningBalance::ClaimableOnChannelClose, "closed1", max),
			lightning(Node::LightningBalance::ClaimableOnChannelClose, "closed2", 1)
		};
		details.pending_balances_from_channel_closures = {
			sweep(Node::PendingSweepBalance::PendingBroadcast, max)
		};
		s = Rescue::BalanceSnapshot::compute({}, details);
		assert(s.claimable == max);
		assert(s.pending_sweep == max);
		assert(s.pending() == max);
		assert(!s.is_complete());

		details.lightning_balances = {
			lightning(Node::LightningBalance::ClaimableOnChannelClose, "closed1", 1)
		};
		s = Rescue::BalanceSnapshot::compute({}, details);
		assert(s.pending() == max);
		assert(!s.is_complete());
	}

	auto ca = Rescue::channel_amount(lightning(Node::LightningBalance::CounterpartyRevokedOutputClaimable, "x", 7));
	assert(ca.first == "x");
	assert(ca.second == 7);

	return 0;
}
