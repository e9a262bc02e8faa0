#include"Jsmn/Object.hpp"
#include"Node/Types.hpp"
#include<sstream>

namespace {

std::uint64_t get_sats(Jsmn::Object const& js, std::string const& field) {
	auto v = js[field];
	if (!v.is_number())
		throw Node::BadResult(field + ": missing or not a number");
	try {
		return std::uint64_t(v);
	} catch (Jsmn::TypeError const&) {
		throw Node::BadResult(field + ": not a satoshi amount");
	}
}

std::string get_string(Jsmn::Object const& js, std::string const& field) {
	auto v = js[field];
	if (!v.is_string())
		throw Node::BadResult(field + ": missing or not a string");
	return std::string(v);
}

Jsmn::Object get_array(Jsmn::Object const& js, std::string const& field) {
	auto v = js[field];
	if (!v.is_array())
		throw Node::BadResult(field + ": missing or not an array");
	return v;
}

}

namespace Node {

char const* to_string(LightningBalance::Kind k) {
	switch (k) {
	case LightningBalance::ClaimableOnChannelClose:
		return "ClaimableOnChannelClose";
	case LightningBalance::ClaimableAwaitingConfirmations:
		return "ClaimableAwaitingConfirmations";
	case LightningBalance::ContentiousClaimable:
		return "ContentiousClaimable";
	case LightningBalance::MaybeTimeoutClaimableHTLC:
		return "MaybeTimeoutClaimableHTLC";
	case LightningBalance::MaybePreimageClaimableHTLC:
		return "MaybePreimageClaimableHTLC";
	case LightningBalance::CounterpartyRevokedOutputClaimable:
		return "CounterpartyRevokedOutputClaimable";
	}
	return "Unknown";
}
char const* to_string(PendingSweepBalance::Kind k) {
	switch (k) {
	case PendingSweepBalance::PendingBroadcast:
		return "PendingBroadcast";
	case PendingSweepBalance::BroadcastAwaitingConfirmation:
		return "BroadcastAwaitingConfirmation";
	case PendingSweepBalance::AwaitingThresholdConfirmations:
		return "AwaitingThresholdConfirmations";
	}
	return "Unknown";
}

std::unique_ptr<LightningBalance::Kind>
lightning_balance_kind_from_string(std::string const& s) {
	static LightningBalance::Kind const all[] = {
		LightningBalance::ClaimableOnChannelClose,
		LightningBalance::ClaimableAwaitingConfirmations,
		LightningBalance::ContentiousClaimable,
		LightningBalance::MaybeTimeoutClaimableHTLC,
		LightningBalance::MaybePreimageClaimableHTLC,
		LightningBalance::CounterpartyRevokedOutputClaimable
	};
	for (auto k : all)
		if (s == to_string(k))
			return std::make_unique<LightningBalance::Kind>(k);
	return nullptr;
}
std::unique_ptr<PendingSweepBalance::Kind>
pending_sweep_kind_from_string(std::string const& s) {
	static PendingSweepBalance::Kind const all[] = {
		PendingSweepBalance::PendingBroadcast,
		PendingSweepBalance::BroadcastAwaitingConfirmation,
		PendingSweepBalance::AwaitingThresholdConfirmations
	};
	for (auto k : all)
		if (s == to_string(k))
			return std::make_unique<PendingSweepBalance::Kind>(k);
	return nullptr;
}

ChannelDetails channel_details_from_json(Jsmn::Object const& js) {
	if (!js.is_object())
		throw BadResult("channel: not an object");
	auto ret = ChannelDetails();
	ret.channel_id = get_string(js, "channel_id");
	ret.counterparty_node_id = get_string(js, "counterparty_node_id");
	ret.channel_value_sats = js.has("channel_value_sats") ?
		get_sats(js, "channel_value_sats") : 0;
	ret.is_usable = js["is_usable"].is_boolean() && bool(js["is_usable"]);
	return ret;
}

BalanceDetails balance_details_from_json(Jsmn::Object const& js) {
	if (!js.is_object())
		throw BadResult("balances: not an object");

	auto ret = BalanceDetails();
	ret.total_onchain_balance_sats = get_sats(
		js, "total_onchain_balance_sats"
	);
	ret.spendable_onchain_balance_sats = get_sats(
		js, "spendable_onchain_balance_sats"
	);
	ret.total_anchor_channels_reserve_sats = get_sats(
		js, "total_anchor_channels_reserve_sats"
	);

	for (auto b : get_array(js, "lightning_balances")) {
		if (!b.is_object())
			throw BadResult("lightning balance: not an object");
		auto type = get_string(b, "type");
		auto kind = lightning_balance_kind_from_string(type);
		if (!kind)
			throw BadResult("unknown lightning balance type " + type);
		ret.lightning_balances.push_back(LightningBalance{
			*kind,
			get_string(b, "channel_id"),
			get_sats(b, "amount_satoshis")
		});
	}

	for (auto b : get_array(js, "pending_balances_from_channel_closures")) {
		if (!b.is_object())
			throw BadResult("pending sweep balance: not an object");
		auto type = get_string(b, "type");
		auto kind = pending_sweep_kind_from_string(type);
		if (!kind)
			throw BadResult("unknown pending sweep balance type " + type);
		auto channel_id = std::string();
		if (b["channel_id"].is_string())
			channel_id = std::string(b["channel_id"]);
		ret.pending_balances_from_channel_closures.push_back(
			PendingSweepBalance{
				*kind,
				std::move(channel_id),
				get_sats(b, "amount_satoshis")
			}
		);
	}

	return ret;
}

std::unique_ptr<Event> event_from_json(Jsmn::Object const& js) {
	if (js.is_null())
		return nullptr;
	if (!js.is_object())
		throw BadResult("event: not an object");
	auto os = std::ostringstream();
	os << js;
	return std::make_unique<Event>(Event{
		get_string(js, "type"),
		os.str()
	});
}

}
