#ifndef JSMN_OBJECT_HPP
#define JSMN_OBJECT_HPP

#include"Jsmn/Detail/Iterator.hpp"
#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail { struct ParseResult; }}
namespace Jsmn { class Parser; }

namespace Jsmn {

/* Thrown when converting or using as incorrect type.  */
class TypeError : public Util::BacktraceException<std::invalid_argument> {
public:
	TypeError() : Util::BacktraceException<std::invalid_argument>("Incorrect type.") { }
};

/** class Jsmn::Object
 *
 * @brief a read-only view of one JSON value inside a
 * parsed datum.
 *
 * @desc Copies are cheap and share the parsed text.
 * A default-constructed Object, or the result of
 * looking up a missing key or index, is null.
 */
class Object {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	Object( std::shared_ptr<Detail::ParseResult>
	      , unsigned int
	      );

	friend class Jsmn::Parser;
	friend class Jsmn::Detail::Iterator;

public:
	Object();

	Object(Object const&) =default;
	Object(Object&&) =default;
	Object& operator=(Object const&) =default;
	Object& operator=(Object&&) =default;

	bool is_null() const;
	bool is_boolean() const;
	bool is_string() const;
	bool is_object() const;
	bool is_array() const;
	bool is_number() const;

	/* Throw TypeError if not of the correct type.  */
	explicit operator bool() const; /* false for null too.  */
	explicit operator std::string() const;
	explicit operator double() const;
	/* Exact; also throws TypeError on a negative,
	 * fractional or out-of-range number.  */
	explicit operator std::uint64_t() const;

	/* Keys of an object, elements of an array.  */
	std::size_t size() const;

	std::vector<std::string> keys() const;
	bool has(std::string const&) const;
	/* Null if absent.  */
	Object operator[](std::string const&) const;
	Object operator[](std::size_t) const;

	/* The JSON text of this value, as received.  */
	std::string direct_text() const;

	/* Iterate over array elements.  */
	typedef Jsmn::Detail::Iterator const_iterator;
	typedef Jsmn::Detail::Iterator iterator;
	iterator begin() const;
	iterator end() const;
};

/* Single-line JSON.  */
std::ostream& operator<<(std::ostream&, Jsmn::Object const&);

}

#endif /* !defined(JSMN_OBJECT_HPP) */
