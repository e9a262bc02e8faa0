#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#include<utility>

#if ENABLE_EXCEPTION_BACKTRACE
# include<cstdlib>
# include<sstream>
# include<string>
# include<vector>
# include<execinfo.h>
# define UNW_LOCAL_ONLY
# include<libunwind.h>
#endif

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief Base for every exception this program
 * throws itself.
 *
 * @desc Wraps the standard exception E, forwarding
 * all constructor arguments.
 * Catch sites can catch either E or the more
 * specific derived type.
 *
 * When built with ENABLE_EXCEPTION_BACKTRACE, the
 * stack is captured at construction and appended to
 * what() the first time it is called.
 */
#if !ENABLE_EXCEPTION_BACKTRACE

template<typename T>
class BacktraceException : public T {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) { }

	const char* what() const noexcept override {
		return T::what();
	}
};

#else /* ENABLE_EXCEPTION_BACKTRACE */

template<typename T>
class BacktraceException : public T {
private:
	std::vector<void*> frames;
	mutable std::string message;

	void capture() {
		auto context = unw_context_t();
		auto cursor = unw_cursor_t();
		unw_getcontext(&context);
		unw_init_local(&cursor, &context);
		while (frames.size() < 64 && unw_step(&cursor) > 0) {
			auto ip = unw_word_t();
			unw_get_reg(&cursor, UNW_REG_IP, &ip);
			frames.push_back(reinterpret_cast<void*>(ip));
		}
	}

public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) {
		capture();
	}

	const char* what() const noexcept override {
		if (!message.empty())
			return message.c_str();
		auto os = std::ostringstream();
		os << T::what() << "\nBacktrace:\n";
		auto symbols = backtrace_symbols( frames.data()
						, int(frames.size())
						);
		for (auto i = std::size_t(0); i < frames.size(); ++i) {
			os << "#" << i << " ";
			if (symbols)
				os << symbols[i];
			else
				os << frames[i];
			os << "\n";
		}
		free(symbols);
		message = os.str();
		return message.c_str();
	}
};

#endif /* ENABLE_EXCEPTION_BACKTRACE */

}

#endif /* UTIL_BACKTRACE_EXCEPTION_HPP */
