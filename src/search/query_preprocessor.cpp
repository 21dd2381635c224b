#include <ragrank/search/query_preprocessor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace ragrank::search {

namespace {

const std::unordered_map<std::string, std::string>& typoCorrections() {
    static const std::unordered_map<std::string, std::string> kTypos = {
        {"teh", "the"},       {"taht", "that"},   {"waht", "what"},
        {"dont", "don't"},    {"cant", "can't"},  {"wont", "won't"},
        {"didnt", "didn't"},  {"doesnt", "doesn't"},
    };
    return kTypos;
}

const std::unordered_map<std::string, std::string>& abbreviations() {
    static const std::unordered_map<std::string, std::string> kAbbreviations = {
        {"pls", "please"},
        {"thx", "thanks"},
        {"ty", "thank you"},
        {"btw", "by the way"},
        {"fyi", "for your information"},
        {"asap", "as soon as possible"},
        {"imo", "in my opinion"},
        {"imho", "in my humble opinion"},
        {"tl;dr", "summary"},
        {"tldr", "summary"},
        {"afaik", "as far as I know"},
        {"iirc", "if I recall correctly"},
        {"etc", "et cetera"},
        {"vs", "versus"},
        {"e.g", "for example"},
        {"i.e", "that is"},
    };
    return kAbbreviations;
}

const std::unordered_set<std::string>& stopwords() {
    static const std::unordered_set<std::string> kStopwords = {
        "a",     "an",    "the",  "is",    "are",    "was",   "were",  "be",    "been",
        "being", "have",  "has",  "had",   "do",     "does",  "did",   "will",  "would",
        "should", "could", "may", "might", "must",   "can",   "of",    "to",    "in",
        "on",    "at",    "by",   "for",   "with",   "about", "as",    "from",  "that",
        "this",  "what",  "which", "who",  "when",   "where", "why",   "how",   "it",
        "its"};
    return kStopwords;
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> splitWhitespace(std::string_view text) {
    std::vector<std::string> words;
    std::istringstream in{std::string(text)};
    std::string word;
    while (in >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

const std::string& lookup(const std::unordered_map<std::string, std::string>& table,
                          const std::string& word) {
    auto it = table.find(toLower(word));
    return it != table.end() ? it->second : word;
}

} // namespace

std::string preprocessQuery(std::string_view query) {
    if (query.empty()) {
        return {};
    }

    std::string joined;
    for (const auto& word : splitWhitespace(query)) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += lookup(abbreviations(), lookup(typoCorrections(), word));
    }

    static const std::regex kRepeatedMarks(R"(([.!?]){2,})");
    static const std::regex kSpaceBeforeMark(R"(\s+([.!?,;:]))");
    std::string cleaned = std::regex_replace(joined, kRepeatedMarks, "$1");
    cleaned = std::regex_replace(cleaned, kSpaceBeforeMark, "$1");

    auto first = cleaned.find_first_not_of(" \t\n\r\f\v");
    auto last = cleaned.find_last_not_of(" \t\n\r\f\v");
    cleaned = first == std::string::npos ? std::string{} : cleaned.substr(first, last - first + 1);

    if (cleaned != query) {
        spdlog::debug("Query preprocessed: '{}' -> '{}'", query, cleaned);
    }
    return cleaned;
}

std::vector<std::string> extractKeywords(std::string_view query) {
    std::vector<std::string> keywords;
    for (auto& word : splitWhitespace(toLower(query))) {
        if (word.size() > 2 && !stopwords().count(word)) {
            keywords.push_back(std::move(word));
        }
    }
    return keywords;
}

} // namespace ragrank::search
