#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ragrank::search {

/**
 * @brief Wrap whole-word matches of the query terms in `**`
 *
 * Matching is case-insensitive; terms shorter than two characters are skipped.
 * Text longer than maxLength is cut to a window centred on the first highlight,
 * marked with "..." where it was cut.
 */
std::string highlightMatches(std::string_view text, const std::vector<std::string>& terms,
                             size_t maxLength = 200);

/**
 * @brief Terms that occur anywhere in the text, case-insensitive
 */
std::vector<std::string> matchedTerms(std::string_view text,
                                      const std::vector<std::string>& terms);

/**
 * @brief Excerpt of `length` characters covering the most distinct terms
 *
 * Windows are tried every 50 characters; the earliest best window wins.
 */
std::string generateSnippet(std::string_view text, const std::vector<std::string>& terms,
                            size_t length = 200);

} // namespace ragrank::search
