#include"Ev/Detail/on_idle.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"

namespace Ev {

Io<void> yield() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)> fail
			  ) {
		Detail::on_idle(std::move(pass));
	});
}

}
