#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/NodeId.hpp"
#include"Net/Fd.hpp"
#include"Node/Rpc.hpp"
#include"Node/RpcNode.hpp"
#include"Scb/Backup.hpp"
#include"Util/Str.hpp"

namespace Node {

class RpcNode::Impl {
public:
	Rpc rpc;
	RpcNodeConfig config;

	Impl( Rescue::Logger& logger
	    , Net::Fd socket
	    , RpcNodeConfig config_
	    ) : rpc(logger, std::move(socket))
	      , config(std::move(config_))
	      { }

	Ev::Io<void> simple(std::string const& method) {
		return rpc.command(method, Json::Out::empty_object())
			.then([](Jsmn::Object) {
			return Ev::lift();
		});
	}
};

RpcNode::RpcNode( Rescue::Logger& logger
		, Net::Fd socket
		, RpcNodeConfig config
		) : pimpl(std::make_unique<Impl>( logger
						, std::move(socket)
						, std::move(config)
						))
		  { }
RpcNode::RpcNode(RpcNode&&) =default;
RpcNode::~RpcNode() =default;

Ev::Io<void>
RpcNode::restore_encoded_channel_monitors(std::vector<Scb::EncodedMonitor> ms) {
	auto params = Json::Out();
	auto obj = params.start_object();
	auto arr = obj.start_array("monitors");
	for (auto const& m : ms) {
		arr.start_object()
			.field("key", m.key)
			.field("value", Util::Str::hexdump(m.value))
		.end_object();
	}
	arr.end_array();
	obj.end_object();
	return pimpl->rpc.command( "restore_encoded_channel_monitors"
				 , std::move(params)
				 ).then([](Jsmn::Object) {
		return Ev::lift();
	});
}

Ev::Io<void> RpcNode::start() {
	auto const& c = pimpl->config;
	auto params = Json::Out()
		.start_object()
			.field("network", c.network)
			.field("esplora_server", c.esplora_server)
			.field("storage_dir", c.storage_dir)
			.field("seed_phrase", c.seed_phrase)
		.end_object()
		;
	return pimpl->rpc.command("start", std::move(params), true)
		.then([](Jsmn::Object) {
		return Ev::lift();
	});
}
Ev::Io<void> RpcNode::stop() {
	return pimpl->simple("stop");
}
Ev::Io<void> RpcNode::sync_wallets() {
	return pimpl->simple("sync_wallets");
}

Ev::Io<void> RpcNode::connect( Ln::NodeId const& peer
			     , std::string const& address
			     , bool persist
			     ) {
	auto params = Json::Out()
		.start_object()
			.field("node_id", std::string(peer))
			.field("address", address)
			.field("persist", persist)
		.end_object()
		;
	return pimpl->rpc.command("connect", std::move(params))
		.then([](Jsmn::Object) {
		return Ev::lift();
	});
}

Ev::Io<std::vector<ChannelDetails>> RpcNode::list_channels() {
	return pimpl->rpc.command("list_channels", Json::Out::empty_object())
		.then([](Jsmn::Object res) {
		if (!res.is_array())
			throw BadResult("list_channels: not an array");
		auto ret = std::vector<ChannelDetails>();
		for (auto c : res)
			ret.push_back(channel_details_from_json(c));
		return Ev::lift(std::move(ret));
	});
}

Ev::Io<BalanceDetails> RpcNode::list_balances() {
	return pimpl->rpc.command("list_balances", Json::Out::empty_object())
		.then([](Jsmn::Object res) {
		return Ev::lift(balance_details_from_json(res));
	});
}

Ev::Io<void> RpcNode::force_close_all_channels_without_broadcasting_txn() {
	return pimpl->simple("force_close_all_channels_without_broadcasting_txn");
}

Ev::Io<std::unique_ptr<Event>> RpcNode::next_event() {
	return pimpl->rpc.command("next_event", Json::Out::empty_object())
		.then([](Jsmn::Object res) {
		return Ev::lift(event_from_json(res));
	});
}
Ev::Io<void> RpcNode::event_handled() {
	return pimpl->simple("event_handled");
}

}
