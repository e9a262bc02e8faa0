#ifndef NODE_TYPES_HPP
#define NODE_TYPES_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<memory>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { class Object; }

namespace Node {

/* The node engine answered with something we cannot
 * interpret.  */
struct BadResult : public Util::BacktraceException<std::runtime_error> {
	explicit
	BadResult(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"node engine result: " + msg
		  ) { }
};

/* A channel the node engine currently tracks.  */
struct ChannelDetails {
	std::string channel_id;
	std::string counterparty_node_id;
	std::uint64_t channel_value_sats;
	bool is_usable;
};

/* Funds held in a channel or its closing outputs.  */
struct LightningBalance {
	enum Kind {
		ClaimableOnChannelClose,
		ClaimableAwaitingConfirmations,
		ContentiousClaimable,
		MaybeTimeoutClaimableHTLC,
		MaybePreimageClaimableHTLC,
		CounterpartyRevokedOutputClaimable
	};
	Kind kind;
	std::string channel_id;
	std::uint64_t amount_satoshis;
};

/* Funds from a closed channel on their way to the
 * on-chain wallet.  */
struct PendingSweepBalance {
	enum Kind {
		PendingBroadcast,
		BroadcastAwaitingConfirmation,
		AwaitingThresholdConfirmations
	};
	Kind kind;
	/* Empty if the node engine did not say.  */
	std::string channel_id;
	std::uint64_t amount_satoshis;
};

struct BalanceDetails {
	std::uint64_t total_onchain_balance_sats;
	std::uint64_t spendable_onchain_balance_sats;
	std::uint64_t total_anchor_channels_reserve_sats;
	std::vector<LightningBalance> lightning_balances;
	std::vector<PendingSweepBalance> pending_balances_from_channel_closures;
};

/* A node engine event.  We only log them, so the payload
 * is kept as its JSON text.  */
struct Event {
	std::string type;
	std::string details;
};

char const* to_string(LightningBalance::Kind);
char const* to_string(PendingSweepBalance::Kind);
/* nullptr if not a known kind.  */
std::unique_ptr<LightningBalance::Kind>
lightning_balance_kind_from_string(std::string const&);
std::unique_ptr<PendingSweepBalance::Kind>
pending_sweep_kind_from_string(std::string const&);

/* Conversions from the node engine's JSON results.
 * Throw Node::BadResult on shape errors.  */
ChannelDetails channel_details_from_json(Jsmn::Object const&);
BalanceDetails balance_details_from_json(Jsmn::Object const&);
/* nullptr if the JSON is null.  */
std::unique_ptr<Event> event_from_json(Jsmn::Object const&);

}

#endif /* !defined(NODE_TYPES_HPP) */
