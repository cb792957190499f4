#pragma once

#include "bookhound/Types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bookhound::search {

// Author mode favours the newest revision of each work; title mode favours
// the most complete file across peers.
enum class RankMode {
    Author,
    Title
};

// Declared size in megabytes; 0 when the text carries no leading number.
double parse_size_mb(std::string_view size_text);

double version_score(std::string_view title);
double size_score(std::string_view size_text);
double format_score(std::string_view extension);
double keyword_score(std::string_view title);

double score(const BookRecord& record, RankMode mode);

// Highest score wins; ties keep the earliest record.
std::optional<RankedRecord> best_of(const std::vector<BookRecord>& records, RankMode mode);

// Groups by normalize_title (first-seen order) and keeps the best of each group.
std::vector<RankedRecord> best_per_title(const std::vector<BookRecord>& records, RankMode mode);

// Every record, best first. Stable for equal scores.
std::vector<RankedRecord> rank(const std::vector<BookRecord>& records, RankMode mode);

std::string normalize_title(std::string_view title);

// Compares normalized forms: equality, containment either way, or word-set
// Jaccard similarity of at least kTitleSimilarityThreshold.
bool titles_match(std::string_view lhs, std::string_view rhs);

constexpr double kTitleSimilarityThreshold = 0.7;

}  // namespace bookhound::search
