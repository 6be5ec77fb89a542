#pragma once

#include "core/media_item.hpp"

/**
 * @brief Weighted match score between two catalog items
 *
 * The score is the raw sum of independent signals (maximum 140) and is
 * compared directly against the collection's similarity threshold.
 * Signals whose inputs are missing on either side contribute nothing.
 */
class SimilarityScorer
{
public:
    static constexpr int TITLE_MATCH_POINTS = 30;
    static constexpr int SAME_YEAR_POINTS = 20;
    static constexpr int ADJACENT_YEAR_POINTS = 10;
    static constexpr int IMDB_MATCH_POINTS = 40;
    static constexpr int TMDB_MATCH_POINTS = 40;
    static constexpr int RUNTIME_MATCH_POINTS = 10;
    static constexpr double RUNTIME_TOLERANCE_MINUTES = 5.0;
    static constexpr int MAX_SCORE = TITLE_MATCH_POINTS + SAME_YEAR_POINTS + IMDB_MATCH_POINTS +
                                     TMDB_MATCH_POINTS + RUNTIME_MATCH_POINTS;

    static int score(const MediaItem &a, const MediaItem &b);

private:
    static bool providerIdsMatch(const MediaItem &a, const MediaItem &b, const std::string &provider);
};
