#include"Aead/Key.hpp"
#include<sodium/utils.h>
#include<string.h>

namespace Aead {

Key::Key() {
	memset(k, 0, sizeof(k));
}
Key::Key(Key const& o) {
	memcpy(k, o.k, sizeof(k));
}
Key& Key::operator=(Key const& o) {
	memcpy(k, o.k, sizeof(k));
	return *this;
}
Key::~Key() {
	sodium_memzero(k, sizeof(k));
}

Key Key::from_buffer(std::uint8_t const buffer[32]) {
	auto ret = Key();
	memcpy(ret.k, buffer, sizeof(ret.k));
	return ret;
}
void Key::to_buffer(std::uint8_t buffer[32]) const {
	memcpy(buffer, k, sizeof(k));
}

bool Key::operator==(Key const& o) const {
	return 0 == sodium_memcmp(k, o.k, sizeof(k));
}

}
