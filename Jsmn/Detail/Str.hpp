#ifndef JSMN_DETAIL_STR_HPP
#define JSMN_DETAIL_STR_HPP

#include<string>

namespace Jsmn { namespace Detail { namespace Str {

/* Body of a JSON string literal for the given UTF-8
 * text, without the quotes.  */
std::string to_escaped(std::string const&);
/* Inverse of the above; \u escapes come out as UTF-8.
 * The input is assumed already validated by jsmn.  */
std::string from_escaped(std::string const&);

/* Locale-independent.  */
double to_double(std::string const&);

}}}

#endif /* !defined(JSMN_DETAIL_STR_HPP) */
