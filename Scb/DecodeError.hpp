#ifndef SCB_DECODEERROR_HPP
#define SCB_DECODEERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Scb {

/** class Scb::DecodeError
 *
 * @brief thrown when a static channel backup cannot
 * be turned into an `Scb::Backup`.
 */
class DecodeError : public Util::BacktraceException<std::runtime_error> {
public:
	enum Kind {
		/* The file could not be read at all.  */
		Unreadable,
		/* Not `<hex>-<hex>`, or bad nonce length.  */
		MalformedEncoding,
		/* Not JSON, or JSON of the wrong shape.  */
		MalformedJson,
		/* Tampered ciphertext, or wrong seed phrase.  */
		AuthenticationFailed
	};

private:
	Kind k;
	std::string d;

public:
	DecodeError() =delete;
	DecodeError(Kind k_, std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			std::string("bad static channel backup: ") + msg
		  )
		, k(k_)
		, d(msg)
		{ }

	Kind kind() const { return k; }
	/* The message without the leading "bad static
	 * channel backup: ".  */
	std::string const& detail() const { return d; }
};

}

#endif /* !defined(SCB_DECODEERROR_HPP) */
