#ifndef AEAD_AES256GCM_HPP
#define AEAD_AES256GCM_HPP

#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Aead { class Key; }

namespace Aead {

/* Thrown when the tag does not verify: the data was
 * tampered with, or the key or nonce is wrong.  */
struct AuthenticationFailed : public Util::BacktraceException<std::runtime_error> {
	AuthenticationFailed()
		: Util::BacktraceException<std::runtime_error>(
			"AES-256-GCM: authentication failed"
		  ) { }
};
/* Thrown when the nonce is not exactly nonce_size bytes.  */
struct InvalidNonce : public Util::BacktraceException<std::invalid_argument> {
	explicit
	InvalidNonce(std::size_t size)
		: Util::BacktraceException<std::invalid_argument>(
			"AES-256-GCM: nonce must be 12 bytes, got "
			+ std::to_string(size)
		  ) { }
};
/* Thrown when the cipher library itself fails.  */
struct CipherError : public Util::BacktraceException<std::runtime_error> {
	explicit
	CipherError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"AES-256-GCM: " + msg
		  ) { }
};

/** AES-256-GCM with a 96-bit nonce, a 128-bit tag
 * appended to the ciphertext, and no associated data.
 */
namespace Aes256Gcm {

auto constexpr nonce_size = std::size_t(12);
auto constexpr tag_size = std::size_t(16);

std::vector<std::uint8_t>
encrypt( Aead::Key const& key
       , std::vector<std::uint8_t> const& nonce
       , std::string const& plaintext
       );

/* Throws AuthenticationFailed, InvalidNonce or CipherError.  */
std::string
decrypt( Aead::Key const& key
       , std::vector<std::uint8_t> const& nonce
       , std::vector<std::uint8_t> const& ciphertext
       );

/* A fresh nonce from the system CSPRNG.  */
std::vector<std::uint8_t> random_nonce();

}

}

#endif /* !defined(AEAD_AES256GCM_HPP) */
