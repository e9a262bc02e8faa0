#ifndef SCB_LOAD_HPP
#define SCB_LOAD_HPP

#include"Scb/Backup.hpp"
#include<string>

namespace Aead { class Key; }
namespace Bip39 { class Mnemonic; }

namespace Scb {

/* All of these throw Scb::DecodeError.  */

/* Parses the plaintext JSON form.  */
Backup parse_plaintext(std::string const& contents);

/* Decrypts the `<nonce_hex>-<ciphertext_hex>` form to
 * its plaintext, without parsing it.  */
std::string decrypt(std::string const& contents, Aead::Key const& key);

/* Decrypts, then parses.  */
Backup parse_encrypted(std::string const& contents, Aead::Key const& key);

/** Scb::load
 *
 * @brief decodes backup file contents of either form.
 *
 * @desc The plaintext form is tried first.
 * If that fails the encrypted form is tried; if that
 * fails too, its error is thrown, kind preserved,
 * with the plaintext failure appended.
 * The mnemonic overload only derives the key if the
 * plaintext form fails.
 */
Backup load(std::string const& contents, Aead::Key const& key);
Backup load(std::string const& contents, Bip39::Mnemonic const& mnemonic);

/* Reads the file, then `load`s it.
 * Unreadable files are DecodeError::Unreadable.
 */
Backup load_file(std::string const& path, Bip39::Mnemonic const& mnemonic);

}

#endif /* !defined(SCB_LOAD_HPP) */
