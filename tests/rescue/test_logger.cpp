#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Net/Fd.hpp"
#include"Rescue/Logger.hpp"
#include"Rescue/log.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<fstream>
#include<sstream>
#include<unistd.h>

namespace {

std::vector<std::string> read_lines(std::string const& path) {
	auto is = std::ifstream(path);
	auto ret = std::vector<std::string>();
	auto line = std::string();
	while (std::getline(is, line))
		ret.push_back(line);
	return ret;
}

}

int main() {
	auto path = std::string("test_logger.tmp");
	unlink(path.c_str());

	{
		auto logger = Rescue::Logger::open(path, Rescue::Info);
		assert(logger.threshold() == Rescue::Info);
		assert(!logger.enabled(Rescue::Debug));
		assert(logger.enabled(Rescue::Warn));

		logger.write(Rescue::Info, "starting");
		logger.write(Rescue::Debug, "dropped");

		auto code = Rescue::log( logger, Rescue::Error
				       , "failed to connect to peer %s at %s"
				       , "02aa", "127.0.0.1:9735"
				       ).then([&]() {
			return Rescue::log(logger, Rescue::Trace, "also dropped");
		}).then([]() {
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);
	}
	/* Appends, never truncates.  */
	{
		auto logger = Rescue::Logger::open(path, Rescue::Trace);
		logger.write(Rescue::Trace, "second run");
	}

	auto lines = read_lines(path);
	assert(lines.size() == 3);

	/* e.g. "[2024-05-01T13:45:07.250Z INFO] starting"  */
	assert(lines[0][0] == '[');
	assert(lines[0][11] == 'T');
	assert(lines[0].substr(25) == " INFO] starting");
	assert(lines[1].substr(25) == " ERROR] failed to connect to peer 02aa at 127.0.0.1:9735");
	assert(lines[2].substr(25) == " TRACE] second run");

	/* Without a file everything is dropped quietly.  */
	{
		auto logger = Rescue::Logger(Net::Fd(), Rescue::Trace);
		logger.write(Rescue::Error, "nowhere");
	}

	auto thrown = false;
	try {
		(void) Rescue::Logger::open("no/such/dir/chanrescue.log", Rescue::Info);
	} catch (std::runtime_error const&) {
		thrown = true;
	}
	assert(thrown);

	assert(std::string(Rescue::to_string(Rescue::Warn)) == "WARN");

	unlink(path.c_str());
	return 0;
}
