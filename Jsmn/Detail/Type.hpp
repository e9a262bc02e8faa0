#ifndef JSMN_DETAIL_TYPE_HPP
#define JSMN_DETAIL_TYPE_HPP

namespace Jsmn { namespace Detail {

/* Mirrors jsmntype_t, without pulling in jsmn.h.  */
enum Type {
	Undefined,
	Object,
	Array,
	String,
	Primitive
};

}}

#endif /* !defined(JSMN_DETAIL_TYPE_HPP) */
