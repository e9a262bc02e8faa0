#include"Jsmn/Detail/Iterator.hpp"
#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Object.hpp"

namespace Jsmn { namespace Detail {

Iterator& Iterator::operator++() {
	index += result->tokens[index].span;
	return *this;
}
Jsmn::Object Iterator::operator*() const {
	return Jsmn::Object(result, index);
}

}}
