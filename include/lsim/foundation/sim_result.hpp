#pragma once

/// @file sim_result.hpp
/// @brief Result<T,E> for explicit error propagation, and the SimResult alias.

#include <cstddef>
#include <utility>
#include <variant>

#include "lsim/foundation/sim_error.hpp"

namespace lsim::foundation {

/// Either a success value or an error.
///
/// Every simulator operation that can fail returns a Result instead of
/// throwing.
///
/// Example:
/// @code
///   auto ratings = computeAutoElo(standings);
///   if (!ratings) {
///       LSIM_LOG_ERROR(LogCategory::Rating, std::string(ratings.error().message()));
///       return;
///   }
///   use(ratings.value());
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (throws std::bad_variant_access on error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v)) {}

    std::variant<T, E> data_;
};

/// Specialization for operations without a success value.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

/// Result specialized with SimError for all simulator operations.
template <typename T>
using SimResult = Result<T, SimError>;

} // namespace lsim::foundation
