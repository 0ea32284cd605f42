#pragma once

/// @file fuzzy_matcher.hpp
/// @brief Near-match suggestions for misspelled point names.

#include "core/types.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace starlane::starmap
{
    /// @brief Ranks candidate names by similarity to a query.
    class SuggestionProvider
    {
    public:
        virtual ~SuggestionProvider() = default;

        /// @brief Return at most `limit` names from `candidates`, best match first.
        [[nodiscard]] virtual std::vector<std::string>
            suggest(std::string_view query, std::span<const std::string> candidates,
                    std::size_t limit) const = 0;
    };

    /// @brief Case-insensitive Jaro-Winkler ranking with a similarity floor.
    class FuzzyMatcher final : public SuggestionProvider
    {
    public:
        static constexpr f64 kDefaultMinSimilarity = 0.75;
        static constexpr std::size_t kDefaultLimit = 3;

        explicit FuzzyMatcher(f64 min_similarity = kDefaultMinSimilarity)
            : m_min_similarity(min_similarity) {}

        [[nodiscard]] std::vector<std::string>
            suggest(std::string_view query, std::span<const std::string> candidates,
                    std::size_t limit) const override;

        /// @brief Jaro-Winkler similarity in [0, 1] (1 = identical), ASCII case-insensitive.
        [[nodiscard]] static f64 similarity(std::string_view a, std::string_view b);

    private:
        f64 m_min_similarity;
    };

} // namespace starlane::starmap
