#ifndef AEAD_KEY_HPP
#define AEAD_KEY_HPP

#include<cstdint>

namespace Aead {

/** class Aead::Key
 *
 * @brief a 256-bit symmetric key, wiped from memory
 * on destruction.
 */
class Key {
private:
	std::uint8_t k[32];

public:
	/* All zeroes.  */
	Key();
	Key(Key const&);
	Key& operator=(Key const&);
	~Key();

	static Key from_buffer(std::uint8_t const buffer[32]);
	void to_buffer(std::uint8_t buffer[32]) const;
	std::uint8_t const* data() const { return k; }

	bool operator==(Key const& o) const;
	bool operator!=(Key const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(AEAD_KEY_HPP) */
