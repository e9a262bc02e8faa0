#ifndef RESCUE_CHANNELSTATE_HPP
#define RESCUE_CHANNELSTATE_HPP

#include<memory>
#include<string>

namespace Rescue {

/* Recovery progress of one channel.
 * The only transition is Pending -> ForceCloseInitiated.
 */
enum class ChannelState {
	Pending,
	ForceCloseInitiated
};

char const* to_string(ChannelState);
/* nullptr if not a known state name.  */
std::unique_ptr<ChannelState> channel_state_from_string(std::string const&);

}

#endif /* !defined(RESCUE_CHANNELSTATE_HPP) */
