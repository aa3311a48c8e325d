#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mycelic {

// Strips ASCII whitespace from both ends.
std::string Trim(std::string_view text);

// Splits text into words the way the unicode61 FTS5 tokenizer with
// remove_diacritics does for Latin text: ASCII letters and digits are
// lower-cased, Latin-1 letters fold to their base letter, other non-ASCII
// code points are word characters, punctuation and invalid UTF-8 separate.
std::vector<std::string> TokenizeWords(std::string_view text);

}  // namespace mycelic
