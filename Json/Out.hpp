#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<sstream>
#include<string>
#include<type_traits>

namespace Json { class Out; }

namespace Json { namespace Detail {

typedef std::ostringstream Content;

/* Scalar serialization.  */
template<typename t, typename = void>
struct Serializer;

template<typename t>
struct Serializer< t
		 , typename std::enable_if< std::is_integral<t>::value
					 && !std::is_same<t, bool>::value
					  >::type
		 > {
	static std::string serialize(t v) {
		if (std::is_signed<t>::value)
			return std::to_string(std::int64_t(v));
		return std::to_string(std::uint64_t(v));
	}
};
template<>
struct Serializer<bool> {
	static std::string serialize(bool v) {
		return v ? "true" : "false";
	}
};
template<>
struct Serializer<std::string> {
	static std::string serialize(std::string const& v) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<std::size_t n>
struct Serializer<char [n]> {
	static std::string serialize(char const v[n]) {
		return Serializer<std::string>::serialize(v);
	}
};

/* Shared by objects and arrays.  */
class Container {
protected:
	Content& content;
	bool started;

	Container(Content& content_, char open) : content(content_)
						, started(false) {
		content << open;
	}

	void encomma() {
		if (started)
			content << ", ";
		started = true;
	}
	void key(std::string const& name) {
		encomma();
		content << Serializer<std::string>::serialize(name) << ": ";
	}
};

template<typename Up> class Array;

template<typename Up>
class Object : private Container {
private:
	Up& up;

public:
	Object(Up& up_, Content& content_) : Container(content_, '{')
					   , up(up_) { }

	template<typename a>
	Object<Up>& field(std::string const& name, a const& value) {
		key(name);
		content << Serializer<a>::serialize(value);
		return *this;
	}

	Array<Object<Up>> start_array(std::string const& name) {
		key(name);
		return Array<Object<Up>>(*this, content);
	}
	Object<Object<Up>> start_object(std::string const& name) {
		key(name);
		return Object<Object<Up>>(*this, content);
	}

	Up& end_object() {
		content << '}';
		return up;
	}
};

template<typename Up>
class Array : private Container {
private:
	Up& up;

public:
	Array(Up& up_, Content& content_) : Container(content_, '[')
					  , up(up_) { }

	template<typename a>
	Array<Up>& entry(a const& value) {
		encomma();
		content << Serializer<a>::serialize(value);
		return *this;
	}

	Object<Array<Up>> start_object() {
		encomma();
		return Object<Array<Up>>(*this, content);
	}

	Up& end_array() {
		content << ']';
		return up;
	}
};

} /* namespace Detail */

/** class Json::Out
 *
 * @brief builds JSON text for RPC parameters and the
 * files we write.
 *
 * @desc Copies share the same text.  Nested builders
 * refer back to their parent, so hold each one in a
 * named local (or finish it within one expression)
 * before starting the next.
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }
	explicit
	Out(Jsmn::Object const& js) : Out() {
		*content << js;
	}

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object<Json::Out> start_object() {
		return Json::Detail::Object<Json::Out>(*this, *content);
	}
	Json::Detail::Array<Json::Out> start_array() {
		return Json::Detail::Array<Json::Out>(*this, *content);
	}

	static
	Json::Out empty_object() {
		return Json::Out().start_object().end_object();
	}
};

namespace Detail {

/* Already-built JSON.  */
template<>
struct Serializer<Json::Out> {
	static std::string serialize(Json::Out const& v) {
		return v.output();
	}
};
template<>
struct Serializer<Jsmn::Object> {
	static std::string serialize(Jsmn::Object const& v) {
		auto os = std::ostringstream();
		os << v;
		return os.str();
	}
};

} /* namespace Detail */

} /* namespace Json */

#endif /* !defined(JSON_OUT_HPP) */
