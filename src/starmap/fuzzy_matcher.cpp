/// @file fuzzy_matcher.cpp
/// @brief Jaro-Winkler similarity and suggestion ranking.

#include "starmap/fuzzy_matcher.hpp"

#include "starmap/point_set.hpp"

#include <algorithm>
#include <cctype>

namespace starlane::starmap
{

namespace
{

std::string_view trim_ascii(std::string_view s)
{
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
    {
        ++b;
    }
    std::size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    {
        --e;
    }
    return s.substr(b, e - b);
}

f64 jaro(const std::string& a, const std::string& b)
{
    if (a.empty() && b.empty())
    {
        return 1.0;
    }
    if (a.empty() || b.empty())
    {
        return 0.0;
    }

    const std::size_t window = std::max(a.size(), b.size()) / 2;
    const std::size_t match_range = window > 0 ? window - 1 : 0;

    std::vector<bool> a_matched(a.size(), false);
    std::vector<bool> b_matched(b.size(), false);
    std::size_t matches = 0;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const std::size_t lo = i > match_range ? i - match_range : 0;
        const std::size_t hi = std::min(i + match_range + 1, b.size());
        for (std::size_t j = lo; j < hi; ++j)
        {
            if (b_matched[j] || a[i] != b[j])
            {
                continue;
            }
            a_matched[i] = true;
            b_matched[j] = true;
            ++matches;
            break;
        }
    }

    if (matches == 0)
    {
        return 0.0;
    }

    std::size_t transpositions = 0;
    std::size_t k = 0;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (!a_matched[i])
        {
            continue;
        }
        while (!b_matched[k])
        {
            ++k;
        }
        if (a[i] != b[k])
        {
            ++transpositions;
        }
        ++k;
    }

    const f64 m = static_cast<f64>(matches);
    const f64 t = static_cast<f64>(transpositions) / 2.0;
    return (m / static_cast<f64>(a.size()) + m / static_cast<f64>(b.size()) + (m - t) / m) / 3.0;
}

} // namespace

// -----------------------------------------------------------------
// similarity
// -----------------------------------------------------------------

f64 FuzzyMatcher::similarity(std::string_view a, std::string_view b)
{
    const std::string la = to_lower_ascii(trim_ascii(a));
    const std::string lb = to_lower_ascii(trim_ascii(b));

    const f64 j = jaro(la, lb);

    // Winkler prefix boost: up to 4 common leading characters, scale 0.1.
    std::size_t prefix = 0;
    while (prefix < 4 && prefix < la.size() && prefix < lb.size() && la[prefix] == lb[prefix])
    {
        ++prefix;
    }
    return j + static_cast<f64>(prefix) * 0.1 * (1.0 - j);
}

// -----------------------------------------------------------------
// suggest
// -----------------------------------------------------------------

std::vector<std::string> FuzzyMatcher::suggest(std::string_view query,
                                               std::span<const std::string> candidates,
                                               std::size_t limit) const
{
    struct Scored
    {
        f64 score;
        const std::string* name;
    };

    std::vector<Scored> scored;
    for (const auto& candidate : candidates)
    {
        const f64 score = similarity(query, candidate);
        if (score >= m_min_similarity)
        {
            scored.push_back({score, &candidate});
        }
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b)
    {
        if (a.score != b.score)
        {
            return a.score > b.score;
        }
        return *a.name < *b.name;
    });

    std::vector<std::string> out;
    for (const auto& s : scored)
    {
        if (out.size() >= limit)
        {
            break;
        }
        if (std::find(out.begin(), out.end(), *s.name) == out.end())
        {
            out.push_back(*s.name);
        }
    }
    return out;
}

} // namespace starlane::starmap
