#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Scb/Backup.hpp"
#include"Scb/DecodeError.hpp"
#include"Util/Str.hpp"

namespace {

Scb::DecodeError malformed(std::string const& where, std::string const& what) {
	return Scb::DecodeError(Scb::DecodeError::MalformedJson, where + ": " + what);
}

Jsmn::Object get_array(Jsmn::Object const& js, std::string const& field) {
	auto arr = js[field];
	if (!arr.is_array())
		throw malformed(field, "missing or not an array");
	return arr;
}

std::string get_string( Jsmn::Object const& js
		      , std::string const& where
		      , std::string const& field
		      ) {
	auto v = js[field];
	if (!v.is_string())
		throw malformed(where + "." + field, "missing or not a string");
	return std::string(v);
}

}

namespace Scb {

std::set<std::string> Backup::channel_ids() const {
	auto ret = std::set<std::string>();
	for (auto const& c : channels)
		ret.insert(c.channel_id);
	return ret;
}

Backup Backup::from_json(Jsmn::Object const& js) {
	if (!js.is_object())
		throw malformed("backup", "not a JSON object");

	auto ret = Backup();

	auto i = std::size_t(0);
	for (auto c : get_array(js, "channels")) {
		auto where = "channels[" + std::to_string(i++) + "]";
		if (!c.is_object())
			throw malformed(where, "not an object");
		auto entry = ChannelEntry();
		entry.channel_id = get_string(c, where, "channel_id");
		entry.peer_id = get_string(c, where, "peer_id");
		entry.peer_socket_address = get_string( c, where
						      , "peer_socket_address"
						      );
		ret.channels.emplace_back(std::move(entry));
	}

	i = 0;
	for (auto m : get_array(js, "monitors")) {
		auto where = "monitors[" + std::to_string(i++) + "]";
		if (!m.is_object())
			throw malformed(where, "not an object");
		auto mon = EncodedMonitor();
		mon.key = get_string(m, where, "key");
		auto hex = get_string(m, where, "value");
		if (!Util::Str::ishex(hex))
			throw malformed(where + ".value", "not a hex string");
		mon.value = Util::Str::hexread(hex);
		ret.monitors.emplace_back(std::move(mon));
	}

	return ret;
}

Json::Out Backup::to_json() const {
	auto ret = Json::Out();
	auto obj = ret.start_object();

	auto chans = obj.start_array("channels");
	for (auto const& c : channels) {
		chans.start_object()
			.field("channel_id", c.channel_id)
			.field("peer_id", c.peer_id)
			.field("peer_socket_address", c.peer_socket_address)
		.end_object();
	}
	chans.end_array();

	auto mons = obj.start_array("monitors");
	for (auto const& m : monitors) {
		mons.start_object()
			.field("key", m.key)
			.field("value", Util::Str::hexdump(m.value))
		.end_object();
	}
	mons.end_array();

	obj.end_object();
	return ret;
}

}
