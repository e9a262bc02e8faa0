#ifndef SCB_DERIVE_KEY_HPP
#define SCB_DERIVE_KEY_HPP

namespace Aead { class Key; }
namespace Bip39 { class Mnemonic; }

namespace Scb {

/** Scb::derive_key
 *
 * @brief derives the static channel backup encryption
 * key from the wallet seed phrase.
 *
 * @desc BIP-39 seed with an empty passphrase, BIP-32
 * master key, then the private key at m/128029'/0'.
 * The path is part of the file format: every
 * previously-encrypted backup depends on it.
 *
 * Deterministic, but slow (2048 rounds of PBKDF2), so
 * prefer running it in an `Ev::ThreadPool`.
 */
Aead::Key derive_key(Bip39::Mnemonic const& mnemonic);

}

#endif /* !defined(SCB_DERIVE_KEY_HPP) */
