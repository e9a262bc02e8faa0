#include"Ev/Detail/on_idle.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include<iostream>

namespace {

void report(std::exception_ptr e) {
	try {
		std::rethrow_exception(e);
	} catch (std::exception const& e) {
		std::cerr << "Unhandled exception in concurrent task: "
			  << e.what()
			  << std::endl
			  ;
	} catch (...) {
		std::cerr << "Unhandled non-standard exception "
			  << "in concurrent task."
			  << std::endl
			  ;
	}
}

}

namespace Ev {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::Io<void>([io]( std::function<void()> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		Detail::on_idle([io]() {
			io.run([]() { }, &report);
		});
		pass();
	});
}

}
