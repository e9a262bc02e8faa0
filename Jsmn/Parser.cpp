#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"

/* jsmn is header-only; its code is instantiated here and
 * nowhere else.  */
#define JSMN_STATIC 1
#undef JSMN_HEADER
#define JSMN_PARENT_LINKS 1
#define JSMN_STRICT 1
# include <jsmn.h>

namespace {

bool is_space(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v';
}

Jsmn::Detail::Type convert(jsmntype_t t) {
	switch (t) {
	case JSMN_OBJECT: return Jsmn::Detail::Object;
	case JSMN_ARRAY: return Jsmn::Detail::Array;
	case JSMN_STRING: return Jsmn::Detail::String;
	case JSMN_PRIMITIVE: return Jsmn::Detail::Primitive;
	case JSMN_UNDEFINED: break;
	}
	return Jsmn::Detail::Undefined;
}

}

namespace Jsmn {

class Parser::Impl {
private:
	std::string buffer;
	/* Start of the datum being scanned.  */
	std::size_t start;
	/* Next character to scan.  */
	std::size_t scan;

	unsigned int depth;
	bool in_string;
	bool in_escape;
	bool in_bare;

	std::vector<jsmntok_t> toks;

	bool in_datum() const {
		return depth != 0 || in_string || in_bare;
	}

	/* Parses buffer[start, end), known to hold exactly one
	 * datum plus, for a bare datum, its delimiter.  */
	Object parse(std::size_t end) {
		auto text = buffer.substr(start, end - start);
		start = end;

		auto base = jsmn_parser();
		auto res = int();
		for (;;) {
			jsmn_init(&base);
			res = jsmn_parse( &base
					, text.c_str(), text.size()
					, toks.data(), toks.size()
					);
			if (res != JSMN_ERROR_NOMEM)
				break;
			toks.resize(toks.size() * 2);
		}
		if (res == JSMN_ERROR_INVAL)
			throw ParseError(text, base.pos);
		if (res <= 0)
			throw ParseError(text, text.size());

		auto pr = std::make_shared<Detail::ParseResult>();
		pr->tokens.resize(res);
		for (auto i = 0; i < res; ++i) {
			auto& t = pr->tokens[i];
			t.type = convert(toks[i].type);
			t.start = toks[i].start;
			t.end = toks[i].end;
			t.size = toks[i].size;
			t.span = 1;
		}
		/* Children always follow their parent.  */
		for (auto i = res - 1; i > 0; --i)
			if (toks[i].parent >= 0)
				pr->tokens[toks[i].parent].span += pr->tokens[i].span;
		pr->text = std::move(text);

		return Object(std::move(pr), 0);
	}

public:
	Impl() : start(0)
	       , scan(0)
	       , depth(0)
	       , in_string(false)
	       , in_escape(false)
	       , in_bare(false)
	       , toks(16)
	       { }

	std::vector<Object> feed(std::string const& text) {
		auto ret = std::vector<Object>();
		buffer += text;

		for (; scan < buffer.size(); ++scan) {
			auto c = buffer[scan];
			if (in_string) {
				if (in_escape)
					in_escape = false;
				else if (c == '\\')
					in_escape = true;
				else if (c == '"') {
					in_string = false;
					if (depth == 0)
						ret.push_back(parse(scan + 1));
				}
				continue;
			}
			if (in_bare) {
				if (is_space(c)) {
					in_bare = false;
					ret.push_back(parse(scan + 1));
				}
				continue;
			}
			if (!in_datum() && is_space(c)) {
				start = scan + 1;
				continue;
			}
			switch (c) {
			case '"':
				in_string = true;
				break;
			case '{':
			case '[':
				++depth;
				break;
			case '}':
			case ']':
				if (depth != 0)
					--depth;
				if (depth == 0)
					ret.push_back(parse(scan + 1));
				break;
			default:
				if (depth == 0)
					in_bare = true;
				break;
			}
		}

		buffer.erase(0, start);
		scan -= start;
		start = 0;
		return ret;
	}
};

Parser::Parser() : pimpl(std::make_unique<Impl>()) { }
Parser::~Parser() =default;

std::vector<Jsmn::Object> Parser::feed(std::string const& text) {
	return pimpl->feed(text);
}

Jsmn::Object parse_document(std::string const& text) {
	auto parser = Parser();
	auto res = parser.feed(text + "\n");
	if (res.size() == 0)
		throw ParseError(text, text.size());
	if (res.size() > 1)
		throw ParseError( text, text.size()
				, "Parse error: trailing data after JSON datum"
				);
	return std::move(res[0]);
}

}
