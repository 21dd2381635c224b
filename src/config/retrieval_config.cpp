#include <ragrank/config/config_helpers.h>
#include <ragrank/config/retrieval_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <type_traits>
#include <vector>

namespace ragrank::config {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

Error invalidValue(const std::string& name, const std::string& value, const char* expected) {
    return Error{ErrorCode::InvalidConfiguration,
                 fmt::format("{} = '{}' is not a valid {}", name, value, expected)};
}

template <typename T> Result<T> parseNumber(const std::string& name, const std::string& value) {
    T parsed{};
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc{} || ptr != last) {
        return invalidValue(name, value, std::is_integral_v<T> ? "integer" : "number");
    }
    if constexpr (std::is_integral_v<T>) {
        if (parsed < 0) {
            return invalidValue(name, value, "non-negative integer");
        }
    }
    return parsed;
}

Result<bool> parseBool(const std::string& name, const std::string& value) {
    const auto v = toLower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return invalidValue(name, value, "boolean");
}

// One configurable setting: where it lives in the file and how it is stored
struct Setting {
    const char* section;
    const char* key;
    std::function<Result<void>(RetrievalSettings&, const std::string& name, const std::string&)>
        assign;
};

template <typename T, typename Field>
Setting numberSetting(const char* section, const char* key, Field field) {
    return Setting{section, key,
                   [field](RetrievalSettings& s, const std::string& name,
                           const std::string& value) -> Result<void> {
                       auto parsed = parseNumber<T>(name, value);
                       if (!parsed)
                           return parsed.error();
                       field(s, parsed.value());
                       return {};
                   }};
}

const std::vector<Setting>& settingsTable() {
    static const std::vector<Setting> kSettings = {
        numberSetting<int64_t>("retrieval", "default_top_k",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.retrieval.defaultTopK = static_cast<size_t>(v);
                               }),
        numberSetting<int64_t>("retrieval", "max_top_k",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.retrieval.maxTopK = static_cast<size_t>(v);
                               }),
        numberSetting<int64_t>("retrieval", "overfetch_factor",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.retrieval.overfetchFactor = static_cast<size_t>(v);
                               }),
        numberSetting<int64_t>("retrieval", "rerank_candidate_cap",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.retrieval.rerankCandidateCap = static_cast<size_t>(v);
                               }),
        numberSetting<int64_t>("retrieval", "rerank_timeout_ms",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.retrieval.rerankTimeout = std::chrono::milliseconds(v);
                               }),
        numberSetting<int64_t>("retrieval", "embed_timeout_ms",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.retrieval.embedTimeout = std::chrono::milliseconds(v);
                               }),
        numberSetting<double>(
            "retrieval", "min_similarity_score",
            [](RetrievalSettings& s, double v) { s.retrieval.minSimilarityScore = v; }),
        numberSetting<double>("retrieval", "rrf_k",
                              [](RetrievalSettings& s, double v) { s.retrieval.rrfK = v; }),
        numberSetting<double>("retrieval", "mmr_lambda",
                              [](RetrievalSettings& s, double v) { s.retrieval.mmrLambda = v; }),
        numberSetting<double>("retrieval", "bm25_k1",
                              [](RetrievalSettings& s, double v) { s.retrieval.bm25.k1 = v; }),
        numberSetting<double>("retrieval", "bm25_b",
                              [](RetrievalSettings& s, double v) { s.retrieval.bm25.b = v; }),
        numberSetting<double>("retrieval", "bm25_epsilon",
                              [](RetrievalSettings& s, double v) { s.retrieval.bm25.epsilon = v; }),
        numberSetting<int64_t>("retrieval", "embedding_dim",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.retrieval.embeddingDim = static_cast<size_t>(v);
                               }),
        Setting{"retrieval", "parallel_scoring",
                [](RetrievalSettings& s, const std::string& name,
                   const std::string& value) -> Result<void> {
                    auto parsed = parseBool(name, value);
                    if (!parsed)
                        return parsed.error();
                    s.retrieval.enableParallelScoring = parsed.value();
                    return {};
                }},
        numberSetting<int64_t>("retrieval", "preview_length",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.retrieval.previewLength = static_cast<size_t>(v);
                               }),
        numberSetting<int64_t>("cache", "max_entries",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.cache.maxEntries = static_cast<size_t>(v);
                               }),
        numberSetting<int64_t>("cache", "ttl_seconds",
                               [](RetrievalSettings& s, int64_t v) {
                                   s.cache.defaultTTL = std::chrono::seconds(v);
                               }),
        Setting{"cache", "enable_statistics",
                [](RetrievalSettings& s, const std::string& name,
                   const std::string& value) -> Result<void> {
                    auto parsed = parseBool(name, value);
                    if (!parsed)
                        return parsed.error();
                    s.cache.enableStatistics = parsed.value();
                    return {};
                }},
        Setting{"logging", "level",
                [](RetrievalSettings& s, const std::string& name,
                   const std::string& value) -> Result<void> {
                    if (!parseLogLevel(value)) {
                        return invalidValue(name, value, "log level");
                    }
                    s.logLevel = toLower(value);
                    return {};
                }},
    };
    return kSettings;
}

std::string envName(const Setting& setting) {
    const std::string section = setting.section;
    if (section == "retrieval") {
        return "RAGRANK_" + toUpper(setting.key);
    }
    if (section == "logging") {
        return "RAGRANK_LOG_" + toUpper(setting.key);
    }
    return "RAGRANK_" + toUpper(section) + "_" + toUpper(setting.key);
}

} // namespace

Result<spdlog::level::level_enum> parseLogLevel(std::string_view level) {
    const auto v = toLower(level);
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return Error{ErrorCode::InvalidConfiguration, fmt::format("unknown log level '{}'", level)};
}

Result<void> applyLogLevel(std::string_view level) {
    auto parsed = parseLogLevel(level);
    if (!parsed) {
        return parsed.error();
    }
    spdlog::set_level(parsed.value());
    return {};
}

Result<RetrievalSettings> loadRetrievalSettings(const std::string& overridePath) {
    RetrievalSettings settings;

    std::string requested = overridePath;
    if (requested.empty()) {
        requested = get_env("RAGRANK_CONFIG").value_or("");
    }
    const auto path = get_config_path(requested.empty() ? "" : expand_tilde(requested).string());

    std::error_code ec;
    const bool haveFile = std::filesystem::exists(path, ec);
    if (haveFile) {
        settings.sourcePath = path;
    } else if (!requested.empty()) {
        return Error{ErrorCode::InvalidConfiguration,
                     fmt::format("config file {} does not exist", path.string())};
    }

    for (const auto& setting : settingsTable()) {
        const std::string fileName = fmt::format("{}.{}", setting.section, setting.key);
        if (haveFile) {
            auto value = parse_config_value(path, setting.section, setting.key);
            if (!value.empty()) {
                if (auto r = setting.assign(settings, fileName, value); !r) {
                    spdlog::error("Invalid value in {}: {}", path.string(), r.error().message);
                    return r.error();
                }
            }
        }

        const auto env = envName(setting);
        if (auto value = get_env(env.c_str())) {
            if (auto r = setting.assign(settings, env, *value); !r) {
                spdlog::error("Invalid environment override: {}", r.error().message);
                return r.error();
            }
        }
    }

    if (auto valid = search::validateRetrievalConfig(settings.retrieval); !valid) {
        return valid.error();
    }
    if (settings.cache.maxEntries == 0) {
        return Error{ErrorCode::InvalidConfiguration, "cache.max_entries must be at least 1"};
    }
    if (settings.cache.defaultTTL.count() <= 0) {
        return Error{ErrorCode::InvalidConfiguration, "cache.ttl_seconds must be positive"};
    }

    if (haveFile) {
        spdlog::debug("Loaded retrieval settings from {}", path.string());
    }
    return settings;
}

} // namespace ragrank::config
