#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Node/NodeIF.hpp"
#include"Rescue/EventDrainer.hpp"
#include"Rescue/log.hpp"

namespace Rescue {

Ev::Io<void> EventDrainer::drain() {
	return node.next_event().then([this](std::unique_ptr<Node::Event> e) {
		if (!e)
			return Ev::lift();
		return Rescue::log( logger, Info
				  , "event: %s %s"
				  , e->type.c_str(), e->details.c_str()
				  ).then([this]() {
			return node.event_handled();
		}).then([this]() {
			++handled_count;
			return Ev::yield();
		}).then([this]() {
			return drain();
		});
	});
}

}
