#ifndef RESCUE_LOGGER_HPP
#define RESCUE_LOGGER_HPP

#include<memory>
#include<string>

namespace Net { class Fd; }

namespace Rescue {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

char const* to_string(LogLevel);

/** class Rescue::Logger
 *
 * @brief line-oriented log sink.
 *
 * @desc Each entry is written as
 * `[<UTC timestamp> <LEVEL>] <message>` on its own
 * line.
 * Entries below the threshold are dropped.
 * A logger constructed on an invalid fd drops
 * everything, which is what tests usually want.
 */
class Logger {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Logger() =delete;
	Logger(Net::Fd fd, LogLevel threshold);
	Logger(Logger&&);
	~Logger();

	/* Opens the file for appending, creating it if needed.
	 * Throws std::runtime_error on failure.  */
	static Logger open(std::string const& path, LogLevel threshold);

	LogLevel threshold() const;
	bool enabled(LogLevel) const;

	/* Writes immediately.  */
	void write(LogLevel, std::string const& message);
};

}

#endif /* !defined(RESCUE_LOGGER_HPP) */
