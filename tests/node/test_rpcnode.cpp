#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Ln/NodeId.hpp"
#include"Net/Fd.hpp"
#include"Node/RpcNode.hpp"
#include"Node/Types.hpp"
#include"Rescue/Logger.hpp"
#include"Scb/Backup.hpp"
#include<assert.h>
#include<errno.h>
#include<fcntl.h>
#include<functional>
#include<map>
#include<sys/socket.h>
#include<sys/types.h>
#include<unistd.h>
#include<vector>

namespace {

std::string result(Jsmn::Object const& req, Json::Out res) {
	return Json::Out()
		.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("id", double(req["id"]))
			.field("result", res)
		.end_object()
		.output()
		;
}

/* Answers requests with whatever the handler gives back,
 * which may be nothing (hold the request) or several
 * responses at once.  */
class ScriptedServer {
private:
	Net::Fd socket;
	Jsmn::Parser parser;
	std::function<std::vector<std::string>(Jsmn::Object const&)> handler;

	Ev::Io<void> writeloop(std::string to_write) {
		return Ev::yield().then([this, to_write]() {
			if (!socket)
				return Ev::lift();
			auto res = write( socket.get()
					, to_write.c_str(), to_write.size()
					);
			if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
				return writeloop(to_write);
			assert(res > 0);
			if (std::size_t(res) < to_write.size())
				return writeloop(to_write.substr(res));
			return Ev::lift();
		});
	}

	Ev::Io<void> respond_all(std::vector<std::string> responses) {
		auto act = Ev::lift();
		for (auto const& r : responses)
			act += writeloop(r + "\n");
		return act;
	}

	/* Set by the handler to hang up after replying.  */
	bool& close_after_reply;

public:
	ScriptedServer( Net::Fd socket_
		      , std::function<std::vector<std::string>(Jsmn::Object const&)> handler_
		      , bool& close_after_reply_
		      ) : socket(std::move(socket_))
			, handler(std::move(handler_))
			, close_after_reply(close_after_reply_) {
		auto flags = fcntl(socket.get(), F_GETFL);
		flags |= O_NONBLOCK;
		fcntl(socket.get(), F_SETFL, flags);
	}

	Ev::Io<void> serve() {
		return Ev::yield().then([this]() {
			if (!socket)
				return Ev::lift();
			auto requests = std::vector<Jsmn::Object>();
			char buf[4096];
			for (;;) {
				auto res = read(socket.get(), buf, sizeof(buf));
				if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
					break;
				if (res <= 0) {
					socket.reset();
					return Ev::lift();
				}
				auto got = parser.feed(std::string(buf, std::size_t(res)));
				requests.insert(requests.end(), got.begin(), got.end());
			}
			auto act = Ev::lift();
			for (auto const& r : requests)
				act += respond_all(handler(r));
			return std::move(act).then([this]() {
				if (close_after_reply)
					socket.reset();
				return serve();
			});
		});
	}
};

}

int main() {
	auto logger = Rescue::Logger(Net::Fd(), Rescue::Trace);

	int sockets[2];
	auto res = socketpair(AF_UNIX, SOCK_STREAM, 0, sockets);
	assert(res >= 0);

	auto calls = std::vector<std::string>();
	auto params = std::map<std::string, Jsmn::Object>();
	auto events = 2;
	auto hang_up = false;
	auto server = ScriptedServer(Net::Fd(sockets[0]), [&](Jsmn::Object const& req) {
		auto method = std::string(req["method"]);
		calls.push_back(method);
		params[method] = req["params"];

		auto out = Json::Out();
		if (method == "list_channels") {
			out = Json::Out(Jsmn::parse_document(R"JSON(
				[ { "channel_id": "aa01"
				  , "counterparty_node_id": "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"
				  , "channel_value_sats": 100000
				  , "is_usable": false
				  }
				]
			)JSON"));
		} else if (method == "list_balances") {
			out = Json::Out(Jsmn::parse_document(R"JSON(
				{ "total_onchain_balance_sats": 12
				, "spendable_onchain_balance_sats": 10
				, "total_anchor_channels_reserve_sats": 2
				, "lightning_balances": []
				, "pending_balances_from_channel_closures": []
				}
			)JSON"));
		} else if (method == "next_event") {
			if (events > 0)
				out = Json::Out(Jsmn::parse_document(R"JSON({"type": "ChannelPending", "channel_id": "aa01"})JSON"));
			else
				out = Json::Out(Jsmn::parse_document("null"));
		} else if (method == "event_handled") {
			--events;
			out = Json::Out::empty_object();
		} else {
			out = Json::Out::empty_object();
		}
		return std::vector<std::string>{ result(req, out) };
	}, hang_up);

	auto config = Node::RpcNodeConfig();
	config.network = "signet";
	config.esplora_server = "https://mutinynet.com/api";
	config.storage_dir = "/tmp/ldk_data";
	config.seed_phrase = "limit reward expect search tissue call visa fit thank cream brave jump";
	auto node = Node::RpcNode(logger, Net::Fd(sockets[1]), config);
	Node::NodeIF& nif = node;

	auto monitors = std::vector<Scb::EncodedMonitor>(1);
	monitors[0].key = "aa01";
	monitors[0].value = {0xde, 0xad};

	auto channels = std::vector<Node::ChannelDetails>();
	auto balances = Node::BalanceDetails();
	auto got_events = std::vector<std::string>();

	std::function<Ev::Io<void>()> drain;
	drain = [&]() {
		return nif.next_event().then([&](std::unique_ptr<Node::Event> e) {
			if (!e)
				return Ev::lift();
			got_events.push_back(e->type);
			return nif.event_handled().then([&]() {
				return drain();
			});
		});
	};

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(server.serve());
	}).then([&]() {
		return nif.restore_encoded_channel_monitors(monitors);
	}).then([&]() {
		return nif.start();
	}).then([&]() {
		return nif.sync_wallets();
	}).then([&]() {
		return nif.connect( Ln::NodeId("02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5")
				  , "127.0.0.1:9735"
				  , true
				  );
	}).then([&]() {
		return nif.force_close_all_channels_without_broadcasting_txn();
	}).then([&]() {
		return nif.list_channels();
	}).then([&](std::vector<Node::ChannelDetails> cs) {
		channels = std::move(cs);
		return nif.list_balances();
	}).then([&](Node::BalanceDetails b) {
		balances = std::move(b);
		return drain();
	}).then([&]() {
		return nif.stop();
	}).then([]() {
		return Ev::lift(0);
	});

	assert(Ev::start(code) == 0);

	assert((calls == std::vector<std::string>{
		"restore_encoded_channel_monitors",
		"start",
		"sync_wallets",
		"connect",
		"force_close_all_channels_without_broadcasting_txn",
		"list_channels",
		"list_balances",
		"next_event", "event_handled",
		"next_event", "event_handled",
		"next_event",
		"stop"
	}));

	auto restore = params["restore_encoded_channel_monitors"];
	assert(restore["monitors"].size() == 1);
	assert(std::string(restore["monitors"][0]["key"]) == "aa01");
	assert(std::string(restore["monitors"][0]["value"]) == "dead");

	auto start = params["start"];
	assert(std::string(start["network"]) == "signet");
	assert(std::string(start["esplora_server"]) == "https://mutinynet.com/api");
	assert(std::string(start["storage_dir"]) == "/tmp/ldk_data");
	assert(std::string(start["seed_phrase"]) == config.seed_phrase);

	auto connect = params["connect"];
	assert(std::string(connect["node_id"]) == "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5");
	assert(std::string(connect["address"]) == "127.0.0.1:9735");
	assert(bool(connect["persist"]));

	assert(channels.size() == 1);
	assert(channels[0].channel_id == "aa01");
	assert(!channels[0].is_usable);
	assert(balances.total_onchain_balance_sats == 12);
	assert(balances.total_anchor_channels_reserve_sats == 2);
	assert(got_events.size() == 2);
	assert(got_events[0] == "ChannelPending");

	return 0;
}
