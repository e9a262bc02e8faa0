#include"Ev/Io.hpp"
#include"Rescue/StopHandle.hpp"
#include<ev.h>
#include<functional>
#include<list>
#include<vector>

namespace Rescue {

class StopHandle::Impl {
private:
	bool stopped;

	/* Information structure for each timer.  */
	struct Info {
		Impl *pimpl;
		std::function<void()> pass;
		std::list<ev_timer>::iterator it;
	};
	std::list<ev_timer> timers;

	std::vector<std::function<void()>> waiters;

	static
	void timer_static_handler(EV_P_ ev_timer *timer, int revents) {
		/* Reacquire control of the info structure.  */
		auto info = std::unique_ptr<Info>((Info*)timer->data);
		auto pass = std::move(info->pass);
		ev_timer_stop(EV_A_ timer);
		info->pimpl->timers.erase(info->it);

		pass();
	}

	/* Takes every timer out, without resuming.  */
	std::vector<std::function<void()>> release_timers() {
		auto timers_copy = std::move(timers);
		timers.clear();

		auto passes = std::vector<std::function<void()>>();
		for (auto& timer : timers_copy) {
			auto info = std::unique_ptr<Info>((Info*) timer.data);
			ev_timer_stop(EV_DEFAULT_ &timer);
			passes.push_back(std::move(info->pass));
		}
		return passes;
	}

public:
	Impl() : stopped(false) { }
	~Impl() {
		/* Anything still waiting is abandoned.  */
		release_timers();
	}

	bool stop() {
		if (stopped)
			return false;
		stopped = true;

		auto passes = release_timers();
		auto waiters_copy = std::move(waiters);
		waiters.clear();
		for (auto& w : waiters_copy)
			passes.push_back(std::move(w));

		for (auto& pass : passes)
			pass();
		return true;
	}
	bool is_stopped() const { return stopped; }

	Ev::Io<void> wait() {
		return Ev::Io<void>([this]( std::function<void()> pass
					  , std::function<void(std::exception_ptr)> fail
					  ) {
			if (stopped)
				return pass();
			waiters.push_back(std::move(pass));
		});
	}

	Ev::Io<void> sleep(double seconds) {
		return Ev::Io<void>([ this
				    , seconds
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (stopped)
				return pass();

			auto it = timers.emplace( timers.begin()
						, ev_timer()
						);
			ev_timer_init(&*it, &timer_static_handler, seconds, 0);
			auto info = std::make_unique<Info>();
			info->pimpl = this;
			info->pass = std::move(pass);
			info->it = it;
			it->data = info.release();
			ev_timer_start(EV_DEFAULT_ &*it);
		});
	}
};

StopHandle::StopHandle() : pimpl(std::make_unique<Impl>()) { }
StopHandle::~StopHandle() { }

bool StopHandle::stop() {
	return pimpl->stop();
}
bool StopHandle::is_stopped() const {
	return pimpl->is_stopped();
}
Ev::Io<void> StopHandle::wait() {
	return pimpl->wait();
}
Ev::Io<void> StopHandle::sleep(double seconds) {
	return pimpl->sleep(seconds);
}

}
