#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<memory>
#include<string>
#include<vector>

namespace Jsmn { class Object; }

namespace Jsmn {

/** class Jsmn::Parser
 *
 * @brief splits a stream of concatenated JSON datums,
 * as read off a socket, and parses each complete one.
 *
 * @desc `feed` returns the datums completed by the
 * given text, possibly none.
 * An incomplete datum is kept until later feeds
 * complete it.
 * A bare number or literal completes only at the
 * whitespace after it.
 *
 * Throws Jsmn::ParseError on invalid JSON; the parser
 * should not be used afterwards.
 */
class Parser {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Parser();
	~Parser();

	Parser(Parser const&) =delete;
	Parser(Parser&&) =delete;

	std::vector<Jsmn::Object> feed(std::string const& text);
};

/** Jsmn::parse_document
 *
 * @brief parses a complete text that must hold
 * exactly one JSON datum, surrounded by optional
 * whitespace.
 *
 * @desc Throws Jsmn::ParseError if the text is not
 * valid JSON, ends in the middle of a datum, or holds
 * more than one datum.
 */
Jsmn::Object parse_document(std::string const& text);

}

#endif /* !defined(JSMN_PARSER_HPP) */
