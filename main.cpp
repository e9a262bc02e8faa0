#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Net/Fd.hpp"
#include"Node/open_rpc_socket.hpp"
#include"Rescue/Main.hpp"
#include<iostream>
#include<memory>
#include<string>
#include<vector>

int main(int argc, char** argv) {
	auto main_obj = std::make_shared<Rescue::Main>(
		std::vector<std::string>(argv, argv + argc),
		std::cin, std::cout, std::cerr,
		&Node::open_rpc_socket
	);
	/* The capture keeps main_obj alive until run completes.  */
	return Ev::start(main_obj->run().then([main_obj](int code) {
		return Ev::lift(code);
	}));
}
