#ifndef SHA512_PBKDF2_HPP
#define SHA512_PBKDF2_HPP

#include<cstddef>
#include<cstdint>
#include<string>

namespace Sha512 {

/** Sha512::pbkdf2
 *
 * @brief PBKDF2 (RFC 8018) with HMAC-SHA512 as the
 * pseudorandom function, writing `out_size` bytes
 * of derived key to `out`.
 *
 * @desc Blocking; with thousands of iterations this
 * belongs in an `Ev::ThreadPool` background function.
 */
void pbkdf2( std::uint8_t* out, std::size_t out_size
	   , std::string const& password
	   , std::string const& salt
	   , std::uint32_t iterations
	   );

}

#endif /* !defined(SHA512_PBKDF2_HPP) */
