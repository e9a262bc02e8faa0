#ifndef BIP39_MNEMONIC_HPP
#define BIP39_MNEMONIC_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Bip39 {

struct InvalidMnemonic : public Util::BacktraceException<std::invalid_argument> {
	explicit
	InvalidMnemonic(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"invalid seed phrase: " + msg
		  ) { }
};

/** class Bip39::Mnemonic
 *
 * @brief a validated BIP-39 English seed phrase.
 *
 * @desc Construction normalizes the phrase (words are
 * lowercased and separated by single spaces), then
 * checks the word count, that every word is in the
 * English word list, and the embedded checksum.
 * The words are wiped from memory on destruction.
 */
class Mnemonic {
private:
	std::vector<std::string> words;

public:
	Mnemonic() =delete;
	/* Throws Bip39::InvalidMnemonic.  */
	explicit
	Mnemonic(std::string const& phrase);
	Mnemonic(Mnemonic const&) =default;
	Mnemonic(Mnemonic&&) =default;
	Mnemonic& operator=(Mnemonic const&) =default;
	Mnemonic& operator=(Mnemonic&&) =default;
	~Mnemonic();

	/* The normalized phrase.  */
	std::string phrase() const;
	std::size_t size() const { return words.size(); }

	/* PBKDF2-HMAC-SHA512 of the normalized phrase, salted
	 * with "mnemonic" followed by the passphrase, 2048
	 * iterations.  */
	void to_seed( std::uint8_t seed[64]
		    , std::string const& passphrase = ""
		    ) const;

	bool operator==(Mnemonic const& o) const {
		return words == o.words;
	}
	bool operator!=(Mnemonic const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(BIP39_MNEMONIC_HPP) */
