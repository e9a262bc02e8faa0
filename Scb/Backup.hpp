#ifndef SCB_BACKUP_HPP
#define SCB_BACKUP_HPP

#include<cstdint>
#include<set>
#include<string>
#include<vector>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Scb {

/* One channel as it existed before the node lost its state.  */
struct ChannelEntry {
	std::string channel_id;
	std::string peer_id;
	std::string peer_socket_address;

	bool operator==(ChannelEntry const& o) const {
		return channel_id == o.channel_id
		    && peer_id == o.peer_id
		    && peer_socket_address == o.peer_socket_address
		     ;
	}
};

/* Opaque persisted channel monitor, handed to the node
 * engine unmodified.  */
struct EncodedMonitor {
	std::string key;
	std::vector<std::uint8_t> value;

	bool operator==(EncodedMonitor const& o) const {
		return key == o.key && value == o.value;
	}
};

/** struct Scb::Backup
 *
 * @brief a parsed static channel backup.
 *
 * @desc JSON shape:
 *
 *     { "channels": [ { "channel_id": "...", "peer_id": "...",
 *                       "peer_socket_address": "host:port" } ],
 *       "monitors": [ { "key": "...", "value": "<hex>" } ] }
 *
 * Other top-level fields are ignored.
 */
struct Backup {
	std::vector<ChannelEntry> channels;
	std::vector<EncodedMonitor> monitors;

	/* Distinct channel ids over all entries.  */
	std::set<std::string> channel_ids() const;

	/* Throws Scb::DecodeError of kind MalformedJson.  */
	static Backup from_json(Jsmn::Object const&);
	Json::Out to_json() const;

	bool operator==(Backup const& o) const {
		return channels == o.channels && monitors == o.monitors;
	}
	bool operator!=(Backup const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(SCB_BACKUP_HPP) */
