#pragma once

#include <string>
#include <string_view>

namespace dfl::text {

// Unicode simple lowercase mapping over UTF-8. Covers ASCII, Latin-1
// Supplement, Latin Extended-A, Greek, Cyrillic, Armenian and fullwidth
// Latin; any other code point, and any byte that is not part of a valid
// UTF-8 sequence, is copied unchanged.
std::string fold_case(std::string_view str);

void fold_case_into(std::string_view str, std::string& out);

char32_t fold_code_point(char32_t cp);

std::string_view trim(std::string_view str);

}  // namespace dfl::text
