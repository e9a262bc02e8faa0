#ifndef RESCUE_RECOVERYSTATE_HPP
#define RESCUE_RECOVERYSTATE_HPP

#include"Rescue/ChannelState.hpp"
#include<cstddef>
#include<map>
#include<memory>
#include<set>
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Rescue {

/** class Rescue::RecoveryState
 *
 * @brief per-channel recovery progress, keyed by
 * peer id then channel id.
 *
 * @desc Saved as
 *
 *     {"version": 2,
 *      "peers": {"<peer_id>": {"<channel_id>": "Pending"}}}
 *
 * Two older shapes are accepted on load:
 * the same nested map without the version wrapper,
 * and `{"force_closed": ["<channel_id>", ...]}`.
 * Channels from the latter have no known peer and are
 * kept under the empty peer id until attribute_peers
 * is called.
 */
class RecoveryState {
public:
	typedef std::map<std::string, ChannelState> Channels;
	typedef std::map<std::string, Channels> Peers;

	static constexpr int version = 2;

private:
	Peers peers;

public:
	RecoveryState() =default;
	RecoveryState(RecoveryState const&) =default;
	RecoveryState(RecoveryState&&) =default;
	RecoveryState& operator=(RecoveryState const&) =default;
	RecoveryState& operator=(RecoveryState&&) =default;

	/* nullptr if the file does not exist.
	 * Throws Rescue::PersistenceError.  */
	static std::unique_ptr<RecoveryState> load(std::string const& path);
	/* Replaces the file atomically.
	 * Throws Rescue::PersistenceError.  */
	void save(std::string const& path) const;

	/* Throws Rescue::PersistenceError.  */
	static RecoveryState from_json(Jsmn::Object const&);
	Json::Out to_json() const;

	/* Throws Rescue::InvalidTransition on an attempt to
	 * move a force-closed channel back to Pending.  */
	void set_channel_state( std::string const& peer_id
			      , std::string const& channel_id
			      , ChannelState state
			      );
	std::unique_ptr<ChannelState>
	get_channel_state( std::string const& peer_id
			 , std::string const& channel_id
			 ) const;

	bool is_empty() const;
	bool has_pending_channels() const;
	std::set<std::string> all_channel_ids() const;
	std::size_t count(ChannelState) const;
	/* Entries not yet attributed to a peer.  */
	bool has_unattributed() const;

	/* Moves each unattributed channel found in the map
	 * (channel id to peer id) under its peer.
	 * Returns the number of channels moved.  */
	std::size_t
	attribute_peers(std::map<std::string, std::string> const& peer_of);

	Peers const& entries() const { return peers; }

	bool operator==(RecoveryState const& o) const {
		return peers == o.peers;
	}
	bool operator!=(RecoveryState const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(RESCUE_RECOVERYSTATE_HPP) */
