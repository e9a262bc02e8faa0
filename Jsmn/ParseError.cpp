#include"Jsmn/ParseError.hpp"

namespace Jsmn {

std::string ParseError::enmessage(std::string const& input, unsigned int i) {
	if (i >= input.size())
		return "Parse error: unexpected end of JSON input";

	/* Show a little context after the failure point.  */
	auto context = input.substr(i, 16);
	for (auto& c : context)
		if (c == '\n' || c == '\r' || c == '\t')
			c = ' ';
	return std::string("Parse error near character ")
	     + std::to_string(i)
	     + ": '" + context + "'"
	     ;
}

}
