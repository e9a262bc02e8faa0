#include"Ev/now.hpp"
#include"Net/Fd.hpp"
#include"Rescue/Logger.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Rw.hpp"
#include"Util/date.hpp"
#include<errno.h>
#include<fcntl.h>
#include<iostream>
#include<stdexcept>
#include<string.h>

namespace Rescue {

char const* to_string(LogLevel l) {
	switch (l) {
	case Trace: return "TRACE";
	case Debug: return "DEBUG";
	case Info: return "INFO";
	case Warn: return "WARN";
	case Error: return "ERROR";
	}
	return "UNKNOWN";
}

class Logger::Impl {
public:
	Net::Fd fd;
	LogLevel threshold;
	bool broken;

	Impl(Net::Fd fd_, LogLevel threshold_)
		: fd(std::move(fd_))
		, threshold(threshold_)
		, broken(false)
		{ }
};

Logger::Logger(Net::Fd fd, LogLevel threshold)
	: pimpl(std::make_unique<Impl>(std::move(fd), threshold)) { }
Logger::Logger(Logger&&) =default;
Logger::~Logger() =default;

Logger Logger::open(std::string const& path, LogLevel threshold) {
	auto fd = Net::Fd::open(path, O_WRONLY | O_CREAT | O_APPEND, 0600);
	if (!fd)
		throw Util::BacktraceException<std::runtime_error>(
			"open " + path + ": " + strerror(errno)
		);
	return Logger(std::move(fd), threshold);
}

LogLevel Logger::threshold() const {
	return pimpl->threshold;
}
bool Logger::enabled(LogLevel l) const {
	return l >= pimpl->threshold;
}

void Logger::write(LogLevel l, std::string const& message) {
	if (!enabled(l) || !pimpl->fd || pimpl->broken)
		return;

	auto line = std::string("[")
		  + Util::date(Ev::now()) + " " + to_string(l)
		  + "] " + message + "\n"
		  ;
	if (!Util::Rw::write_all(pimpl->fd.get(), line.c_str(), line.size())) {
		/* Keep running without a log rather than abort
		 * a recovery halfway.  */
		pimpl->broken = true;
		std::cerr << "chanrescue: log write failed: "
			  << strerror(errno)
			  << "; further log entries are dropped"
			  << std::endl;
	}
}

}
