#ifndef BIP39_WORDLIST_HPP
#define BIP39_WORDLIST_HPP

#include<cstdint>
#include<string>

namespace Bip39 {

/* Word at the given 11-bit index.  */
char const* word(std::uint16_t index);
/* Index of the given lowercase word, or -1 if it is
 * not in the list.  */
int word_index(std::string const& word);

}

#endif /* !defined(BIP39_WORDLIST_HPP) */
