#include "core/similarity_scorer.hpp"
#include "core/string_utils.hpp"
#include "core/title_normalizer.hpp"
#include <cmath>
#include <cstdlib>

int SimilarityScorer::score(const MediaItem &a, const MediaItem &b)
{
    int total = 0;

    if (StringUtils::equalsIgnoreCase(TitleNormalizer::normalize(a.name), TitleNormalizer::normalize(b.name)))
    {
        total += TITLE_MATCH_POINTS;
    }

    if (a.production_year && b.production_year)
    {
        int year_diff = std::abs(*a.production_year - *b.production_year);
        if (year_diff == 0)
            total += SAME_YEAR_POINTS;
        else if (year_diff == 1)
            total += ADJACENT_YEAR_POINTS;
    }

    if (providerIdsMatch(a, b, "Imdb"))
        total += IMDB_MATCH_POINTS;
    if (providerIdsMatch(a, b, "Tmdb"))
        total += TMDB_MATCH_POINTS;

    if (a.runtime_minutes && b.runtime_minutes &&
        std::fabs(*a.runtime_minutes - *b.runtime_minutes) <= RUNTIME_TOLERANCE_MINUTES)
    {
        total += RUNTIME_MATCH_POINTS;
    }

    return total;
}

bool SimilarityScorer::providerIdsMatch(const MediaItem &a, const MediaItem &b, const std::string &provider)
{
    std::string id_a = a.getProviderId(provider);
    std::string id_b = b.getProviderId(provider);
    return !id_a.empty() && !id_b.empty() && StringUtils::equalsIgnoreCase(id_a, id_b);
}
