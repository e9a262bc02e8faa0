#include"Ev/Detail/on_idle.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include<ev.h>
#include<iostream>

namespace Ev {

int start(Io<int> main) {
	auto loop = ev_default_loop(0);
	if (!loop) {
		std::cerr << "libev failed to initialize" << std::endl;
		return 255;
	}

	auto exit_code = 255;
	/* The program is over once main completes, even if
	 * sockets or greenthreads are still around.  */
	Detail::on_idle([loop, &main, &exit_code]() {
		main.run([loop, &exit_code](int code) {
			exit_code = code;
			ev_break(loop, EVBREAK_ALL);
		}, [loop, &exit_code](std::exception_ptr e) {
			try {
				std::rethrow_exception(e);
			} catch (std::exception const& e) {
				std::cerr << "Unhandled exception: "
					  << e.what()
					  << std::endl
					  ;
			} catch (...) {
				std::cerr << "Unhandled exception of unknown type."
					  << std::endl
					  ;
			}
			exit_code = 254;
			ev_break(loop, EVBREAK_ALL);
		});
	});

	ev_run(loop, 0);

	return exit_code;
}

}
