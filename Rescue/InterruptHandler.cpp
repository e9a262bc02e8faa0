#include"Rescue/InterruptHandler.hpp"
#include<ev.h>
#include<signal.h>

namespace Rescue {

class InterruptHandler::Impl {
private:
	std::function<void(int)> on_interrupt;
	ev_signal sigint;
	ev_signal sigterm;
	bool active;

	void disarm() {
		if (!active)
			return;
		active = false;
		ev_signal_stop(EV_DEFAULT_ &sigint);
		ev_signal_stop(EV_DEFAULT_ &sigterm);
	}

	static
	void handler(EV_P_ ev_signal* w, int revents) {
		auto self = reinterpret_cast<Impl*>(w->data);
		auto signum = w->signum;
		self->disarm();
		self->on_interrupt(signum);
	}

public:
	explicit
	Impl(std::function<void(int)> on_interrupt_)
		: on_interrupt(std::move(on_interrupt_))
		, active(true) {
		ev_signal_init(&sigint, &handler, SIGINT);
		sigint.data = this;
		ev_signal_init(&sigterm, &handler, SIGTERM);
		sigterm.data = this;
		ev_signal_start(EV_DEFAULT_ &sigint);
		ev_signal_start(EV_DEFAULT_ &sigterm);
	}
	~Impl() {
		disarm();
	}
};

InterruptHandler::InterruptHandler(std::function<void(int)> on_interrupt)
	: pimpl(std::make_unique<Impl>(std::move(on_interrupt))) { }
InterruptHandler::~InterruptHandler() { }

}
