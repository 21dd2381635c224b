#include <ragrank/search/highlighting.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace ragrank::search {

namespace {

constexpr size_t kSnippetStep = 50;
constexpr size_t kMinTermLength = 2;

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string escapeRegex(std::string_view term) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(term.size() * 2);
    for (char c : term) {
        if (kSpecial.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

} // namespace

std::string highlightMatches(std::string_view text, const std::vector<std::string>& terms,
                             size_t maxLength) {
    if (terms.empty() || text.empty()) {
        return std::string(text.substr(0, maxLength));
    }

    std::string highlighted(text);
    for (const auto& term : terms) {
        if (term.size() < kMinTermLength) {
            continue;
        }
        const std::regex pattern("\\b(" + escapeRegex(term) + ")\\b",
                                 std::regex::ECMAScript | std::regex::icase);
        highlighted = std::regex_replace(highlighted, pattern, "**$1**");
    }

    if (highlighted.size() <= maxLength) {
        return highlighted;
    }

    const auto firstHighlight = highlighted.find("**");
    if (firstHighlight != std::string::npos && firstHighlight > 0) {
        const size_t start = firstHighlight > maxLength / 2 ? firstHighlight - maxLength / 2 : 0;
        std::string window = highlighted.substr(start, maxLength);
        if (start > 0) {
            window = "..." + window;
        }
        if (window.size() >= maxLength) {
            window += "...";
        }
        return window;
    }
    return highlighted.substr(0, maxLength) + "...";
}

std::vector<std::string> matchedTerms(std::string_view text,
                                      const std::vector<std::string>& terms) {
    std::vector<std::string> matched;
    const std::string lowered = toLower(text);
    for (const auto& term : terms) {
        if (term.size() < kMinTermLength) {
            continue;
        }
        if (lowered.find(toLower(term)) != std::string::npos) {
            matched.push_back(term);
        }
    }
    return matched;
}

std::string generateSnippet(std::string_view text, const std::vector<std::string>& terms,
                            size_t length) {
    if (terms.empty() || text.size() <= length) {
        return std::string(text.substr(0, length));
    }

    std::vector<std::string> loweredTerms;
    loweredTerms.reserve(terms.size());
    for (const auto& term : terms) {
        loweredTerms.push_back(toLower(term));
    }

    size_t bestPos = 0;
    size_t bestScore = 0;
    for (size_t i = 0; i < text.size() - length; i += kSnippetStep) {
        const std::string window = toLower(text.substr(i, length));
        const auto score = static_cast<size_t>(
            std::count_if(loweredTerms.begin(), loweredTerms.end(), [&](const std::string& t) {
                return window.find(t) != std::string::npos;
            }));
        if (score > bestScore) {
            bestScore = score;
            bestPos = i;
        }
    }

    std::string snippet(text.substr(bestPos, length));
    if (bestPos > 0) {
        snippet = "..." + snippet;
    }
    if (bestPos + length < text.size()) {
        snippet += "...";
    }
    return snippet;
}

} // namespace ragrank::search
