#include"Jsmn/Detail/Str.hpp"
#include<cstdint>
#include<locale>
#include<sstream>

namespace {

char const hexdigits[] = "0123456789abcdef";

std::uint32_t read_hex4(std::string const& s, std::size_t i) {
	auto ret = std::uint32_t(0);
	for (auto j = i; j < i + 4 && j < s.size(); ++j) {
		auto c = s[j];
		ret <<= 4;
		if (c >= '0' && c <= '9')
			ret |= std::uint32_t(c - '0');
		else if (c >= 'a' && c <= 'f')
			ret |= std::uint32_t(c - 'a' + 10);
		else if (c >= 'A' && c <= 'F')
			ret |= std::uint32_t(c - 'A' + 10);
	}
	return ret;
}

void put_utf8(std::string& out, std::uint32_t cp) {
	if (cp < 0x80) {
		out += char(cp);
	} else if (cp < 0x800) {
		out += char(0xC0 | (cp >> 6));
		out += char(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		out += char(0xE0 | (cp >> 12));
		out += char(0x80 | ((cp >> 6) & 0x3F));
		out += char(0x80 | (cp & 0x3F));
	} else {
		out += char(0xF0 | (cp >> 18));
		out += char(0x80 | ((cp >> 12) & 0x3F));
		out += char(0x80 | ((cp >> 6) & 0x3F));
		out += char(0x80 | (cp & 0x3F));
	}
}

}

namespace Jsmn { namespace Detail { namespace Str {

std::string to_escaped(std::string const& s) {
	auto ret = std::string();
	ret.reserve(s.size());
	for (auto c : s) {
		auto u = (unsigned char) c;
		switch (c) {
		case '"': ret += "\\\""; break;
		case '\\': ret += "\\\\"; break;
		case '\b': ret += "\\b"; break;
		case '\f': ret += "\\f"; break;
		case '\n': ret += "\\n"; break;
		case '\r': ret += "\\r"; break;
		case '\t': ret += "\\t"; break;
		default:
			if (u < 0x20) {
				ret += "\\u00";
				ret += hexdigits[u >> 4];
				ret += hexdigits[u & 0xF];
			} else {
				ret += c;
			}
		}
	}
	return ret;
}

std::string from_escaped(std::string const& s) {
	auto ret = std::string();
	ret.reserve(s.size());
	for (auto i = std::size_t(0); i < s.size(); ++i) {
		if (s[i] != '\\' || i + 1 == s.size()) {
			ret += s[i];
			continue;
		}
		++i;
		switch (s[i]) {
		case 'b': ret += '\b'; break;
		case 'f': ret += '\f'; break;
		case 'n': ret += '\n'; break;
		case 'r': ret += '\r'; break;
		case 't': ret += '\t'; break;
		case 'u': {
			auto cp = read_hex4(s, i + 1);
			i += 4;
			/* Surrogate pair.  */
			if ( cp >= 0xD800 && cp < 0xDC00
			  && i + 6 < s.size()
			  && s[i + 1] == '\\' && s[i + 2] == 'u'
			   ) {
				auto lo = read_hex4(s, i + 3);
				if (lo >= 0xDC00 && lo < 0xE000) {
					cp = 0x10000
					   + ((cp - 0xD800) << 10)
					   + (lo - 0xDC00)
					   ;
					i += 6;
				}
			}
			put_utf8(ret, cp);
		} break;
		/* \" \\ \/ */
		default: ret += s[i]; break;
		}
	}
	return ret;
}

double to_double(std::string const& s) {
	auto is = std::istringstream(s);
	is.imbue(std::locale::classic());
	auto ret = double(0);
	is >> ret;
	return ret;
}

}}}
