#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"Rescue/RecoveryState.hpp"
#include"Rescue/errors.hpp"
#include"Util/Rw.hpp"
#include<errno.h>
#include<fcntl.h>
#include<stdio.h>
#include<string.h>
#include<unistd.h>

namespace {

std::string errno_message(std::string const& op, std::string const& path) {
	return op + " " + path + ": " + strerror(errno);
}

Rescue::RecoveryState::Channels
channels_from_json(std::string const& peer_id, Jsmn::Object const& js) {
	if (!js.is_object())
		throw Rescue::PersistenceError(
			"peer " + peer_id + ": not a JSON object"
		);
	auto ret = Rescue::RecoveryState::Channels();
	for (auto const& channel_id : js.keys()) {
		auto v = js[channel_id];
		auto state = std::unique_ptr<Rescue::ChannelState>();
		if (v.is_string())
			state = Rescue::channel_state_from_string(std::string(v));
		if (!state)
			throw Rescue::PersistenceError(
				"channel " + channel_id + ": unknown state"
			);
		ret[channel_id] = *state;
	}
	return ret;
}

Rescue::RecoveryState::Peers peers_from_json(Jsmn::Object const& js) {
	if (!js.is_object())
		throw Rescue::PersistenceError("peers: not a JSON object");
	auto ret = Rescue::RecoveryState::Peers();
	for (auto const& peer_id : js.keys())
		ret[peer_id] = channels_from_json(peer_id, js[peer_id]);
	return ret;
}

}

namespace Rescue {

std::unique_ptr<RecoveryState> RecoveryState::load(std::string const& path) {
	auto fd = Net::Fd::open(path, O_RDONLY);
	if (!fd) {
		if (errno == ENOENT)
			return nullptr;
		throw PersistenceError(errno_message("open", path));
	}

	auto text = std::string();
	if (!Util::Rw::read_to_eof(fd.get(), text))
		throw PersistenceError(errno_message("read", path));

	auto js = Jsmn::Object();
	try {
		js = Jsmn::parse_document(text);
	} catch (Jsmn::ParseError const& e) {
		throw PersistenceError(path + ": corrupt: " + e.what());
	}
	return std::make_unique<RecoveryState>(from_json(js));
}

void RecoveryState::save(std::string const& path) const {
	auto tmp = path + ".tmp";
	auto text = to_json().output() + "\n";

	auto fd = Net::Fd::open(tmp, O_WRONLY | O_CREAT | O_TRUNC, 0600);
	if (!fd)
		throw PersistenceError(errno_message("open", tmp));
	if (!Util::Rw::write_all(fd.get(), text.c_str(), text.size()))
		throw PersistenceError(errno_message("write", tmp));
	if (fsync(fd.get()) < 0)
		throw PersistenceError(errno_message("fsync", tmp));
	if (!fd.close())
		throw PersistenceError(errno_message("close", tmp));

	if (rename(tmp.c_str(), path.c_str()) < 0)
		throw PersistenceError(errno_message("rename", tmp));
}

RecoveryState RecoveryState::from_json(Jsmn::Object const& js) {
	if (!js.is_object())
		throw PersistenceError("not a JSON object");

	auto ret = RecoveryState();

	if (js.has("version")) {
		auto v = js["version"];
		if (!v.is_number() || double(v) != double(version))
			throw PersistenceError("unsupported version");
		ret.peers = peers_from_json(js["peers"]);
		return ret;
	}

	if (js.has("force_closed")) {
		auto arr = js["force_closed"];
		if (!arr.is_array())
			throw PersistenceError("force_closed: not an array");
		for (auto id : arr) {
			if (!id.is_string())
				throw PersistenceError(
					"force_closed: channel id not a string"
				);
			ret.peers[""][std::string(id)] =
				ChannelState::ForceCloseInitiated;
		}
		return ret;
	}

	ret.peers = peers_from_json(js);
	return ret;
}

Json::Out RecoveryState::to_json() const {
	auto ret = Json::Out();
	auto obj = ret.start_object();
	obj.field("version", version);
	auto ps = obj.start_object("peers");
	for (auto const& p : peers) {
		auto cs = ps.start_object(p.first);
		for (auto const& c : p.second)
			cs.field(c.first, std::string(to_string(c.second)));
		cs.end_object();
	}
	ps.end_object();
	obj.end_object();
	return ret;
}

void RecoveryState::set_channel_state( std::string const& peer_id
				     , std::string const& channel_id
				     , ChannelState state
				     ) {
	auto& cs = peers[peer_id];
	auto it = cs.find(channel_id);
	if ( it != cs.end()
	  && it->second == ChannelState::ForceCloseInitiated
	  && state == ChannelState::Pending
	   )
		throw InvalidTransition(
			"channel " + channel_id +
			": already force-closed, cannot return to Pending"
		);
	cs[channel_id] = state;
}

std::unique_ptr<ChannelState>
RecoveryState::get_channel_state( std::string const& peer_id
				, std::string const& channel_id
				) const {
	auto p = peers.find(peer_id);
	if (p == peers.end())
		return nullptr;
	auto c = p->second.find(channel_id);
	if (c == p->second.end())
		return nullptr;
	return std::make_unique<ChannelState>(c->second);
}

bool RecoveryState::is_empty() const {
	for (auto const& p : peers)
		if (!p.second.empty())
			return false;
	return true;
}

bool RecoveryState::has_pending_channels() const {
	return count(ChannelState::Pending) != 0;
}

std::set<std::string> RecoveryState::all_channel_ids() const {
	auto ret = std::set<std::string>();
	for (auto const& p : peers)
		for (auto const& c : p.second)
			ret.insert(c.first);
	return ret;
}

std::size_t RecoveryState::count(ChannelState s) const {
	auto ret = std::size_t(0);
	for (auto const& p : peers)
		for (auto const& c : p.second)
			if (c.second == s)
				++ret;
	return ret;
}

bool RecoveryState::has_unattributed() const {
	auto it = peers.find("");
	return it != peers.end() && !it->second.empty();
}

std::size_t
RecoveryState::attribute_peers(std::map<std::string, std::string> const& peer_of) {
	auto un = peers.find("");
	if (un == peers.end())
		return 0;

	auto moved = std::size_t(0);
	auto& chans = un->second;
	for (auto c = chans.begin(); c != chans.end(); ) {
		auto p = peer_of.find(c->first);
		if (p == peer_of.end() || p->second.empty()) {
			++c;
			continue;
		}
		auto& dest = peers[p->second];
		auto d = dest.find(c->first);
		/* Keep whichever is further along.  */
		if ( d == dest.end()
		  || c->second == ChannelState::ForceCloseInitiated
		   )
			dest[c->first] = c->second;
		c = chans.erase(c);
		++moved;
	}
	if (chans.empty())
		peers.erase(un);

	return moved;
}

}
