#include "bookhound/search/CandidateRanker.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace bookhound::search {

namespace {

struct Weight {
    std::string_view key;
    double value;
};

constexpr std::array<Weight, 5> kVersionLadder = {{
    {"v5", 100.0},
    {"v4", 80.0},
    {"v3", 60.0},
    {"v2", 40.0},
    {"v1", 20.0},
}};

constexpr std::array<Weight, 5> kFormatScores = {{
    {"epub", 30.0},
    {"mobi", 20.0},
    {"azw3", 15.0},
    {"pdf", 10.0},
    {"txt", 5.0},
}};

constexpr std::array<Weight, 9> kSizeUnits = {{
    {"B", 0.000001},
    {"KB", 0.001},
    {"K", 0.001},
    {"MB", 1.0},
    {"M", 1.0},
    {"GB", 1000.0},
    {"G", 1000.0},
    {"TB", 1000000.0},
    {"T", 1000000.0},
}};

constexpr std::array<std::string_view, 5> kQualityKeywords = {"retail", "final", "complete", "unabridged", "original"};
constexpr std::array<std::string_view, 3> kLeadingArticles = {"the ", "a ", "an "};

constexpr double kQualityBonus = 25.0;
constexpr double kAuthorNewestBonus = 50.0;
constexpr double kTitleSizeWeight = 0.5;
constexpr double kReasonableSizeBonus = 20.0;
constexpr double kOversizePenalty = 10.0;

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

std::set<std::string> word_set(const std::string& text) {
    std::set<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.insert(word);
    }
    return words;
}

}  // namespace

double parse_size_mb(std::string_view size_text) {
    static const std::regex pattern(R"(^(\d+(?:\.\d+)?)\s*([KMGT]?B?))");
    const auto upper = to_upper(trim(size_text));
    std::smatch match;
    if (!std::regex_search(upper, match, pattern)) {
        return 0.0;
    }
    const double number = std::strtod(match[1].str().c_str(), nullptr);
    const auto unit = match[2].length() == 0 ? std::string("B") : match[2].str();
    for (const auto& [key, multiplier] : kSizeUnits) {
        if (key == unit) {
            return number * multiplier;
        }
    }
    return number;
}

double version_score(std::string_view title) {
    const auto lowered = to_lower(std::string(title));
    for (const auto& [key, value] : kVersionLadder) {
        if (contains(lowered, key)) {
            return value;
        }
    }
    return 0.0;
}

double size_score(std::string_view size_text) {
    const auto megabytes = parse_size_mb(size_text);
    double value = std::log10(std::max(megabytes, 0.1)) * 10.0;
    if (megabytes >= 0.5 && megabytes <= 50.0) {
        value += kReasonableSizeBonus;
    } else if (megabytes > 100.0) {
        value -= kOversizePenalty;
    }
    return std::max(value, 0.0);
}

double format_score(std::string_view extension) {
    const auto lowered = to_lower(std::string(extension));
    for (const auto& [key, value] : kFormatScores) {
        if (key == lowered) {
            return value;
        }
    }
    return 0.0;
}

double keyword_score(std::string_view title) {
    const auto lowered = to_lower(std::string(title));
    const bool found = std::any_of(kQualityKeywords.begin(), kQualityKeywords.end(), [&](std::string_view keyword) {
        return contains(lowered, keyword);
    });
    return found ? kQualityBonus : 0.0;
}

double score(const BookRecord& record, RankMode mode) {
    const auto sized = size_score(record.declared_size_text);
    double total = version_score(record.title) + sized + format_score(record.extension) + keyword_score(record.title);
    if (mode == RankMode::Author) {
        if (contains(to_lower(record.title), "v5")) {
            total += kAuthorNewestBonus;
        }
    } else {
        total += sized * kTitleSizeWeight;
    }
    return total;
}

std::optional<RankedRecord> best_of(const std::vector<BookRecord>& records, RankMode mode) {
    std::optional<RankedRecord> best;
    for (const auto& record : records) {
        const auto value = score(record, mode);
        if (!best || value > best->score) {
            best = RankedRecord{record, value};
        }
    }
    return best;
}

std::vector<RankedRecord> best_per_title(const std::vector<BookRecord>& records, RankMode mode) {
    std::vector<std::vector<BookRecord>> groups;
    std::unordered_map<std::string, std::size_t> index;
    for (const auto& record : records) {
        const auto key = normalize_title(record.title);
        const auto [it, inserted] = index.emplace(key, groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(record);
    }

    std::vector<RankedRecord> best;
    best.reserve(groups.size());
    for (const auto& group : groups) {
        if (auto winner = best_of(group, mode)) {
            best.push_back(std::move(*winner));
        }
    }
    return best;
}

std::vector<RankedRecord> rank(const std::vector<BookRecord>& records, RankMode mode) {
    std::vector<RankedRecord> ranked;
    ranked.reserve(records.size());
    for (const auto& record : records) {
        ranked.push_back(RankedRecord{record, score(record, mode)});
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedRecord& lhs, const RankedRecord& rhs) {
        return lhs.score > rhs.score;
    });
    return ranked;
}

std::string normalize_title(std::string_view title) {
    static const std::regex parenthesised(R"(\s*\([^)]*\)\s*)");
    static const std::regex bracketed(R"(\s*\[[^\]]*\]\s*)");
    static const std::regex version_token(R"(\bv\d+\b)");
    static const std::regex whitespace(R"(\s+)");

    auto normalized = to_lower(trim(title));
    for (const auto article : kLeadingArticles) {
        if (normalized.starts_with(article)) {
            normalized.erase(0, article.size());
            break;
        }
    }
    normalized = std::regex_replace(normalized, parenthesised, " ");
    normalized = std::regex_replace(normalized, bracketed, " ");
    normalized = std::regex_replace(normalized, version_token, " ");
    normalized = std::regex_replace(normalized, whitespace, " ");
    return trim(normalized);
}

bool titles_match(std::string_view lhs, std::string_view rhs) {
    const auto left = normalize_title(lhs);
    const auto right = normalize_title(rhs);
    if (left.empty() || right.empty()) {
        return false;
    }
    if (left == right || contains(left, right) || contains(right, left)) {
        return true;
    }

    const auto left_words = word_set(left);
    const auto right_words = word_set(right);
    std::size_t overlap = 0;
    for (const auto& word : left_words) {
        overlap += right_words.count(word);
    }
    const auto total = left_words.size() + right_words.size() - overlap;
    if (total == 0) {
        return false;
    }
    return static_cast<double>(overlap) / static_cast<double>(total) >= kTitleSimilarityThreshold;
}

}  // namespace bookhound::search
