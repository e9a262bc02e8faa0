#include"Ev/Detail/on_idle.hpp"
#include<ev.h>
#include<memory>

namespace {

struct IdleTask {
	ev_idle watcher;
	std::function<void()> f;
};

void idle_handler(EV_P_ ev_idle* w, int) {
	auto task = std::unique_ptr<IdleTask>(static_cast<IdleTask*>(w->data));
	ev_idle_stop(EV_A_ &task->watcher);
	auto f = std::move(task->f);
	task = nullptr;
	f();
}

}

namespace Ev { namespace Detail {

void on_idle(std::function<void()> f) {
	auto task = std::make_unique<IdleTask>();
	task->f = std::move(f);
	ev_idle_init(&task->watcher, &idle_handler);
	task->watcher.data = task.get();
	/* Owned by the loop until the handler runs.  */
	ev_idle_start(EV_DEFAULT_ &task.release()->watcher);
}

}}
