#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include<limits>
#include<utility>

namespace Jsmn {

class Object::Impl {
private:
	std::shared_ptr<Detail::ParseResult> result;
	unsigned int index;

	/* Built on first lookup: decoded key and token
	 * index of its value for objects, token index of
	 * each element for arrays.  */
	mutable bool indexed;
	mutable std::vector<std::pair<std::string, unsigned int>> members;
	mutable std::vector<unsigned int> elements;

	void build_index() const {
		if (indexed)
			return;
		indexed = true;

		auto const& tok = token();
		auto child = index + 1;
		for (auto n = 0; n < tok.size; ++n) {
			auto const& ctok = result->tokens[child];
			if (tok.type == Detail::Object)
				members.emplace_back( Detail::Str::from_escaped(text(ctok))
						    , child + 1
						    );
			else
				elements.push_back(child);
			child += ctok.span;
		}
	}

	std::string text(Detail::Token const& tok) const {
		return result->text.substr(tok.start, tok.end - tok.start);
	}

public:
	Impl( std::shared_ptr<Detail::ParseResult> result_
	    , unsigned int index_
	    ) : result(std::move(result_))
	      , index(index_)
	      , indexed(false)
	      { }

	Detail::Token const& token() const {
		return result->tokens[index];
	}
	Detail::Type type() const {
		return token().type;
	}
	char first_char() const {
		return result->text[token().start];
	}
	std::string direct_text() const {
		return text(token());
	}

	std::size_t size() const {
		if (type() != Detail::Object && type() != Detail::Array)
			throw TypeError();
		return std::size_t(token().size);
	}

	std::vector<std::string> keys() const {
		if (type() != Detail::Object)
			throw TypeError();
		build_index();
		auto ret = std::vector<std::string>();
		for (auto const& m : members)
			ret.push_back(m.first);
		return ret;
	}
	/* Later duplicates of a key are ignored.  */
	std::shared_ptr<Impl> lookup(std::string const& key) const {
		if (type() != Detail::Object)
			throw TypeError();
		build_index();
		for (auto const& m : members)
			if (m.first == key)
				return std::make_shared<Impl>(result, m.second);
		return nullptr;
	}
	std::shared_ptr<Impl> lookup(std::size_t i) const {
		if (type() != Detail::Array)
			throw TypeError();
		build_index();
		if (i >= elements.size())
			return nullptr;
		return std::make_shared<Impl>(result, elements[i]);
	}

	Detail::Iterator begin() const {
		return Detail::Iterator(result, index + 1);
	}
	Detail::Iterator end() const {
		return Detail::Iterator(result, index + token().span);
	}
};

Object::Object() : pimpl(nullptr) { }

Object::Object( std::shared_ptr<Detail::ParseResult> result
	      , unsigned int index
	      ) : pimpl(std::make_shared<Impl>(std::move(result), index)) { }

bool Object::is_null() const {
	return !pimpl
	    || (pimpl->type() == Detail::Primitive && pimpl->first_char() == 'n')
	     ;
}
bool Object::is_boolean() const {
	if (!pimpl || pimpl->type() != Detail::Primitive)
		return false;
	auto c = pimpl->first_char();
	return c == 't' || c == 'f';
}
bool Object::is_string() const {
	return pimpl && pimpl->type() == Detail::String;
}
bool Object::is_object() const {
	return pimpl && pimpl->type() == Detail::Object;
}
bool Object::is_array() const {
	return pimpl && pimpl->type() == Detail::Array;
}
bool Object::is_number() const {
	return pimpl
	    && pimpl->type() == Detail::Primitive
	    && !is_null() && !is_boolean()
	     ;
}

Object::operator bool() const {
	if (is_null())
		return false;
	if (!is_boolean())
		throw TypeError();
	return pimpl->first_char() == 't';
}
Object::operator std::string() const {
	if (!is_string())
		throw TypeError();
	return Detail::Str::from_escaped(pimpl->direct_text());
}
Object::operator double() const {
	if (!is_number())
		throw TypeError();
	return Detail::Str::to_double(pimpl->direct_text());
}
Object::operator std::uint64_t() const {
	if (!is_number())
		throw TypeError();
	auto max = std::numeric_limits<std::uint64_t>::max();
	auto ret = std::uint64_t(0);
	for (auto c : pimpl->direct_text()) {
		if (c < '0' || c > '9')
			throw TypeError();
		auto d = std::uint64_t(c - '0');
		if (ret > (max - d) / 10)
			throw TypeError();
		ret = ret * 10 + d;
	}
	return ret;
}

std::size_t Object::size() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->size();
}
std::vector<std::string> Object::keys() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->keys();
}
bool Object::has(std::string const& key) const {
	if (!pimpl)
		throw TypeError();
	return pimpl->lookup(key) != nullptr;
}
Object Object::operator[](std::string const& key) const {
	if (!pimpl)
		throw TypeError();
	auto ret = Object();
	ret.pimpl = pimpl->lookup(key);
	return ret;
}
Object Object::operator[](std::size_t i) const {
	if (!pimpl)
		throw TypeError();
	auto ret = Object();
	ret.pimpl = pimpl->lookup(i);
	return ret;
}

std::string Object::direct_text() const {
	if (!pimpl)
		return "null";
	return pimpl->direct_text();
}

Detail::Iterator Object::begin() const {
	if (!is_array())
		throw TypeError();
	return pimpl->begin();
}
Detail::Iterator Object::end() const {
	if (!is_array())
		throw TypeError();
	return pimpl->end();
}

std::ostream& operator<<(std::ostream& os, Jsmn::Object const& o) {
	if (o.is_string()) {
		os << '"' << Detail::Str::to_escaped(std::string(o)) << '"';
	} else if (o.is_object()) {
		os << '{';
		auto first = true;
		for (auto const& k : o.keys()) {
			if (!first)
				os << ", ";
			first = false;
			os << '"' << Detail::Str::to_escaped(k) << "\": " << o[k];
		}
		os << '}';
	} else if (o.is_array()) {
		os << '[';
		auto first = true;
		for (auto e : o) {
			if (!first)
				os << ", ";
			first = false;
			os << e;
		}
		os << ']';
	} else {
		/* Numbers, booleans and null as received.  */
		os << o.direct_text();
	}
	return os;
}

}
