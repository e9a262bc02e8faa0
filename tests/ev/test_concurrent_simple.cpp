#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<stdexcept>
#include<vector>

int main() {
	auto order = std::vector<int>();

	auto code = Ev::start(Ev::concurrent(Ev::lift().then([&]() {
		order.push_back(2);
		return Ev::lift();
	})).then([&]() {
		/* Started, but not yet run.  */
		assert(order.empty());
		order.push_back(1);
		return Ev::yield();
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		assert(order.size() == 2);
		assert(order[1] == 2);
		return Ev::lift(0);
	}));
	assert(code == 0);
	assert(order.size() == 2);
	assert(order[0] == 1);

	/* An exception escaping a concurrent task does not
	 * reach the task that launched it.  */
	auto reached = false;
	code = Ev::start(Ev::concurrent(Ev::lift().then([]() {
		throw std::runtime_error("from concurrent task");
		return Ev::lift();
	})).then([]() {
		return Ev::yield();
	}).then([]() {
		return Ev::yield();
	}).then([&]() {
		reached = true;
		return Ev::lift(0);
	}));
	assert(code == 0);
	assert(reached);

	return 0;
}
