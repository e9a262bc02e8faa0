#ifndef SCB_ENCODE_HPP
#define SCB_ENCODE_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Aead { class Key; }
namespace Bip39 { class Mnemonic; }
namespace Scb { struct Backup; }

namespace Scb {

/* The plaintext JSON form, newline-terminated.  */
std::string encode_plaintext(Backup const& backup);

/* The `<nonce_hex>-<ciphertext_hex>` form.
 * Never reuse a nonce with the same key.  */
std::string encrypt( Backup const& backup
		   , Aead::Key const& key
		   , std::vector<std::uint8_t> const& nonce
		   );
/* Derives the key and picks a random nonce.  */
std::string encrypt( Backup const& backup
		   , Bip39::Mnemonic const& mnemonic
		   );

}

#endif /* !defined(SCB_ENCODE_HPP) */
