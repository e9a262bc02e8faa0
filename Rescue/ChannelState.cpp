#include"Rescue/ChannelState.hpp"

namespace Rescue {

char const* to_string(ChannelState s) {
	switch (s) {
	case ChannelState::Pending:
		return "Pending";
	case ChannelState::ForceCloseInitiated:
		return "ForceCloseInitiated";
	}
	return "Unknown";
}

std::unique_ptr<ChannelState> channel_state_from_string(std::string const& s) {
	if (s == "Pending")
		return std::make_unique<ChannelState>(ChannelState::Pending);
	if (s == "ForceCloseInitiated")
		return std::make_unique<ChannelState>(ChannelState::ForceCloseInitiated);
	return nullptr;
}

}
