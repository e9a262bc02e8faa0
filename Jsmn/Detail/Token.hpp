#ifndef JSMN_DETAIL_TOKEN_HPP
#define JSMN_DETAIL_TOKEN_HPP

#include"Jsmn/Detail/Type.hpp"

namespace Jsmn { namespace Detail {

struct Token {
	Type type;
	/* Byte offsets into the datum text.  */
	int start;
	int end;
	/* Elements of an array, keys of an object, 1 for a
	 * key that has its value.  */
	int size;
	/* Number of tokens making up this datum, itself
	 * included.  The next sibling is at index + span.  */
	unsigned int span;
};

}}

#endif /* !defined(JSMN_DETAIL_TOKEN_HPP) */
