#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Node/Types.hpp"
#include<assert.h>

namespace {

bool bad(std::string const& text) {
	try {
		(void) Node::balance_details_from_json(Jsmn::parse_document(text));
	} catch (Node::BadResult const&) {
		return true;
	}
	return false;
}

}

int main() {
	{
		auto c = Node::channel_details_from_json(Jsmn::parse_document(R"JSON(
			{ "channel_id": "aa01"
			, "counterparty_node_id": "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
			, "channel_value_sats": 250000
			, "is_usable": true
			}
		)JSON"));
		assert(c.channel_id == "aa01");
		assert(c.channel_value_sats == 250000);
		assert(c.is_usable);

		auto thrown = false;
		try {
			(void) Node::channel_details_from_json(Jsmn::parse_document(R"JSON({"channel_id": 1})JSON"));
		} catch (Node::BadResult const&) {
			thrown = true;
		}
		assert(thrown);
	}

	{
		auto b = Node::balance_details_from_json(Jsmn::parse_document(R"JSON(
			{ "total_onchain_balance_sats": 1000
			, "spendable_onchain_balance_sats": 900
			, "total_anchor_channels_reserve_sats": 100
			, "lightning_balances":
			  [ { "type": "ClaimableAwaitingConfirmations"
			    , "channel_id": "aa01"
			    , "amount_satoshis": 5000
			    , "confirmation_height": 800000
			    }
			  ]
			, "pending_balances_from_channel_closures":
			  [ { "type": "PendingBroadcast", "amount_satoshis": 10 }
			  , { "type": "AwaitingThresholdConfirmations"
			    , "channel_id": "aa02"
			    , "amount_satoshis": 20
			    }
			  ]
			}
		)JSON"));
		assert(b.total_onchain_balance_sats == 1000);
		assert(b.spendable_onchain_balance_sats == 900);
		assert(b.total_anchor_channels_reserve_sats == 100);
		assert(b.lightning_balances.size() == 1);
		assert(b.lightning_balances[0].kind == Node::LightningBalance::ClaimableAwaitingConfirmations);
		assert(b.lightning_balances[0].amount_satoshis == 5000);
		assert(b.pending_balances_from_channel_closures.size() == 2);
		assert(b.pending_balances_from_channel_closures[0].channel_id.empty());
		assert(b.pending_balances_from_channel_closures[1].channel_id == "aa02");
		assert(b.pending_balances_from_channel_closures[1].kind == Node::PendingSweepBalance::AwaitingThresholdConfirmations);
	}

	auto const empty_lists = std::string(R"JSON(, "lightning_balances": [], "pending_balances_from_channel_closures": []})JSON");
	assert(!bad(R"JSON({"total_onchain_balance_sats": 0, "spendable_onchain_balance_sats": 0, "total_anchor_channels_reserve_sats": 0)JSON" + empty_lists));
	assert(bad(R"JSON({"total_onchain_balance_sats": -1, "spendable_onchain_balance_sats": 0, "total_anchor_channels_reserve_sats": 0)JSON" + empty_lists));
	assert(bad(R"JSON({"total_onchain_balance_sats": 1.5, "spendable_onchain_balance_sats": 0, "total_anchor_channels_reserve_sats": 0)JSON" + empty_lists));
	assert(bad(R"JSON({"spendable_onchain_balance_sats": 0, "total_anchor_channels_reserve_sats": 0)JSON" + empty_lists));
	assert(bad(R"JSON({"total_onchain_balance_sats": 0, "spendable_onchain_balance_sats": 0, "total_anchor_channels_reserve_sats": 0, "lightning_balances": [{"type": "Mystery", "channel_id": "x", "amount_satoshis": 1}], "pending_balances_from_channel_closures": []})JSON"));
	assert(bad("[]"));

	for (auto k : { Node::LightningBalance::ClaimableOnChannelClose
		      , Node::LightningBalance::CounterpartyRevokedOutputClaimable
		      })
		assert(*Node::lightning_balance_kind_from_string(Node::to_string(k)) == k);
	assert(!Node::lightning_balance_kind_from_string("claimableonchannelclose"));
	assert(*Node::pending_sweep_kind_from_string("BroadcastAwaitingConfirmation") == Node::PendingSweepBalance::BroadcastAwaitingConfirmation);
	assert(!Node::pending_sweep_kind_from_string(""));

	assert(!Node::event_from_json(Jsmn::parse_document("null")));
	{
		auto e = Node::event_from_json(Jsmn::parse_document(R"JSON({"type": "ChannelClosed", "channel_id": "aa01"})JSON"));
		assert(e);
		assert(e->type == "ChannelClosed");
		assert(e->details.find("aa01") != std::string::npos);
	}

	return 0;
}
