#ifndef JSMN_DETAIL_ITERATOR_HPP
#define JSMN_DETAIL_ITERATOR_HPP

#include<memory>

namespace Jsmn { namespace Detail { struct ParseResult; }}
namespace Jsmn { class Object; }

namespace Jsmn { namespace Detail {

/* Walks the elements of an array by token spans.  */
class Iterator {
private:
	std::shared_ptr<ParseResult> result;
	unsigned int index;

	friend class Jsmn::Object;

	Iterator( std::shared_ptr<ParseResult> result_
		, unsigned int index_
		) : result(std::move(result_)), index(index_) { }

public:
	Iterator() : result(), index(0) { }
	Iterator(Iterator const&) =default;
	Iterator& operator=(Iterator const&) =default;

	bool operator==(Iterator const& o) const {
		return result == o.result && index == o.index;
	}
	bool operator!=(Iterator const& o) const {
		return !(*this == o);
	}

	Iterator& operator++();
	Iterator operator++(int) {
		auto prev = *this;
		++(*this);
		return prev;
	}

	Jsmn::Object operator*() const;
};

}}

#endif /* !defined(JSMN_DETAIL_ITERATOR_HPP) */
