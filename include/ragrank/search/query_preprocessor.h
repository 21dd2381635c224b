#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ragrank::search {

/**
 * @brief Clean up a raw user query before retrieval
 *
 * Collapses whitespace, replaces common typos and expands chat abbreviations
 * word by word (case-insensitive lookup), collapses runs of `.!?` into one
 * mark, removes whitespace before punctuation and trims.
 */
std::string preprocessQuery(std::string_view query);

/**
 * @brief Lower-cased query words minus stopwords, longer than two characters
 *
 * Used for highlighting and for the response metadata.
 */
std::vector<std::string> extractKeywords(std::string_view query);

} // namespace ragrank::search
