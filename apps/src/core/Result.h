#pragma once

#include <utility>
#include <variant>

namespace ArcticLink {

/**
 * @brief Value-or-error return type used across every component boundary.
 *
 * Index-based storage so that T and E may be the same type
 * (e.g. Result<std::string, std::string>).
 *
 * Usage:
 *   auto result = Result<int, std::string>::okay(42);
 *   if (result.isError()) { log(result.errorValue()); }
 */
template <typename T, typename E>
class Result {
public:
    Result() = default;

    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool isValue() const { return data_.index() == 0; }
    [[nodiscard]] bool isError() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& errorValue() { return std::get<1>(data_); }
    const E& errorValue() const { return std::get<1>(data_); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& v) : data_(index, std::forward<V>(v))
    {}

    std::variant<T, E> data_;
};

} // namespace ArcticLink
