#undef NDEBUG
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Scb/Backup.hpp"
#include"Scb/DecodeError.hpp"
#include"Scb/load.hpp"
#include<assert.h>

namespace {

Scb::DecodeError::Kind failure_kind(std::string const& text) {
	try {
		(void) Scb::parse_plaintext(text);
	} catch (Scb::DecodeError const& e) {
		return e.kind();
	}
	assert(false);
	return Scb::DecodeError::Unreadable;
}

}

int main() {
	auto text = std::string(R"JSON(
	{ "node_id": "037e702144c4fa485d42f0f69864e943605823763866cf4bf619d2d2cf2eda420b"
	, "channels":
	  [ { "channel_id": "aa01"
	    , "peer_id": "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
	    , "peer_socket_address": "127.0.0.1:9735"
	    }
	  , { "channel_id": "aa02"
	    , "peer_id": "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
	    , "peer_socket_address": "127.0.0.1:9735"
	    }
	  , { "channel_id": "aa01"
	    , "peer_id": "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
	    , "peer_socket_address": "127.0.0.1:9735"
	    }
	  ]
	, "monitors": [ { "key": "monitors/aa01", "value": "00ff10" } ]
	}
	)JSON");

	auto b = Scb::parse_plaintext(text);
	assert(b.channels.size() == 3);
	assert(b.channels[1].channel_id == "aa02");
	assert(b.channels[1].peer_socket_address == "127.0.0.1:9735");
	assert(b.channel_ids().size() == 2);
	assert(b.monitors.size() == 1);
	assert(b.monitors[0].key == "monitors/aa01");
	assert((b.monitors[0].value == std::vector<std::uint8_t>{0x00, 0xff, 0x10}));

	/* to_json drops unknown fields but keeps everything else.  */
	auto again = Scb::Backup::from_json(Jsmn::parse_document(b.to_json().output()));
	assert(again == b);

	assert(failure_kind("") == Scb::DecodeError::MalformedJson);
	assert(failure_kind("[]") == Scb::DecodeError::MalformedJson);
	assert(failure_kind(R"JSON({"channels": []})JSON") == Scb::DecodeError::MalformedJson);
	assert(failure_kind(R"JSON({"channels": [1], "monitors": []})JSON") == Scb::DecodeError::MalformedJson);
	assert(failure_kind(R"JSON({"channels": [{"channel_id": "x", "peer_id": "y"}], "monitors": []})JSON") == Scb::DecodeError::MalformedJson);
	assert(failure_kind(R"JSON({"channels": [], "monitors": [{"key": "k", "value": "xyz"}]})JSON") == Scb::DecodeError::MalformedJson);

	/* Empty but well-formed.  */
	auto empty = Scb::parse_plaintext(R"JSON({"channels": [], "monitors": []})JSON");
	assert(empty.channels.empty());
	assert(empty.channel_ids().empty());

	return 0;
}
