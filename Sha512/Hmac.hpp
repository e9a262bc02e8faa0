#ifndef SHA512_HMAC_HPP
#define SHA512_HMAC_HPP

#include<cstddef>
#include<cstdint>
#include<memory>

namespace Sha512 {

/** class Sha512::Hmac
 *
 * @brief object that lets you stream bytes to be
 * authenticated with HMAC-SHA512 under a fixed key,
 * then generate the 64-byte MAC of all the bytes
 * streamed in.
 *
 * @desc Copying duplicates the keyed midstate, so a
 * keyed object can be reused as a template for many
 * messages under the same key.
 * The internal state is wiped on destruction.
 */
class Hmac {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Hmac() =delete;
	Hmac(void const* key, std::size_t key_size);
	Hmac(Hmac&&);
	Hmac(Hmac const&);
	~Hmac();

	/* Is it still valid, or has it been finalized?  */
	explicit
	operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	void feed(void const* p, std::size_t size);

	void finalize(std::uint8_t out[64])&&;
};

/* One-shot HMAC-SHA512.  */
void hmac( std::uint8_t out[64]
	 , void const* key, std::size_t key_size
	 , void const* data, std::size_t data_size
	 );

}

#endif /* !defined(SHA512_HMAC_HPP) */
