#ifndef RESCUE_EVENTDRAINER_HPP
#define RESCUE_EVENTDRAINER_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }
namespace Node { class NodeIF; }
namespace Rescue { class Logger; }

namespace Rescue {

/* Acknowledges node engine events so its queue does
 * not back up.  We have no use for them beyond the
 * log.  */
class EventDrainer {
private:
	Node::NodeIF& node;
	Logger& logger;
	std::size_t handled_count;

public:
	EventDrainer() =delete;
	EventDrainer(Node::NodeIF& node_, Logger& logger_)
		: node(node_), logger(logger_), handled_count(0) { }

	/* Handles events until none is left.  */
	Ev::Io<void> drain();

	std::size_t handled() const { return handled_count; }
};

}

#endif /* !defined(RESCUE_EVENTDRAINER_HPP) */
