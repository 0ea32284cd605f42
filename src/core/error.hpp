#pragma once

/// @file error.hpp
/// @brief Structured engine errors and the Result<T> value-or-error holder.

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace starlane
{
    /// @brief Category of a recoverable engine error.
    enum class ErrorKind
    {
        UnknownPoint,        ///< Name resolution miss
        InvalidConstraint,   ///< Request rejected before search
        RouteNotFound,       ///< Search exhausted under the active constraints
        CorruptIndex,        ///< Index bytes failed magic/checksum/structure checks
        UnsupportedVersion,  ///< Index written by a newer format version
        HeatCalculation,     ///< Ship heat model could not evaluate a jump
        ShipData,            ///< Invalid ship attributes, loadout or fuel input
        Io,                  ///< File could not be read or written (hosts and loaders only)
    };

    [[nodiscard]] std::string_view to_string(ErrorKind kind);

    /// @brief A recoverable error with enough context for the caller to adjust the request.
    ///
    /// Only the context fields relevant to the kind are populated; message()
    /// renders them into a single line.
    struct Error
    {
        ErrorKind kind = ErrorKind::InvalidConstraint;
        std::string reason;                    ///< Free-form cause (InvalidConstraint, CorruptIndex, ...)
        std::string name;                      ///< UnknownPoint: the name that failed to resolve
        std::vector<std::string> suggestions;  ///< UnknownPoint: ranked near-matches
        std::string start;                     ///< RouteNotFound: requested start name
        std::string goal;                      ///< RouteNotFound: requested goal name
        std::string hint;                      ///< RouteNotFound: most restrictive active constraint
        int version = 0;                       ///< UnsupportedVersion: version found in the header
        int supported = 0;                     ///< UnsupportedVersion: newest version this build reads
        std::string path;                      ///< Io: file involved

        [[nodiscard]] std::string message() const;

        // ---- Factories ----
        [[nodiscard]] static Error unknown_point(std::string name, std::vector<std::string> suggestions);
        [[nodiscard]] static Error invalid_constraint(std::string reason);
        [[nodiscard]] static Error route_not_found(std::string start, std::string goal, std::string hint = {});
        [[nodiscard]] static Error corrupt_index(std::string reason);
        [[nodiscard]] static Error unsupported_version(int version, int supported);
        [[nodiscard]] static Error heat_calculation(std::string reason);
        [[nodiscard]] static Error ship_data(std::string reason);
        [[nodiscard]] static Error io(std::string path, std::string reason);
    };

    /// @brief Either a value of type T or an Error.
    template <typename T>
    class Result
    {
    public:
        Result(T value) : m_storage(std::in_place_index<0>, std::move(value)) {}
        Result(Error error) : m_storage(std::in_place_index<1>, std::move(error)) {}

        [[nodiscard]] bool has_value() const { return m_storage.index() == 0; }
        explicit operator bool() const { return has_value(); }

        [[nodiscard]] T& value() & { return std::get<0>(m_storage); }
        [[nodiscard]] const T& value() const& { return std::get<0>(m_storage); }
        [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_storage)); }

        [[nodiscard]] const Error& error() const { return std::get<1>(m_storage); }

        T* operator->() { return &value(); }
        const T* operator->() const { return &value(); }
        T& operator*() & { return value(); }
        const T& operator*() const& { return value(); }

    private:
        std::variant<T, Error> m_storage;
    };

    /// @brief Result of an operation that produces no value.
    template <>
    class Result<void>
    {
    public:
        Result() = default;
        Result(Error error) : m_error(std::move(error)) {}

        [[nodiscard]] bool has_value() const { return !m_error.has_value(); }
        explicit operator bool() const { return has_value(); }

        [[nodiscard]] const Error& error() const { return *m_error; }

    private:
        std::optional<Error> m_error;
    };

} // namespace starlane
