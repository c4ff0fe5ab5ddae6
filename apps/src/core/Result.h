#pragma once

#include <utility>
#include <variant>

namespace EvoScope {

/**
 * Value-or-error return type.
 *
 * Construct with Result<T, E>::okay(value) or Result<T, E>::error(err) and check
 * isError() / isValue() before calling value() or errorValue().
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E err) { return Result(std::in_place_index<1>, std::move(err)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    const T& value() const& { return std::get<0>(data_); }
    T& value() & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    const E& errorValue() const& { return std::get<1>(data_); }
    E& errorValue() & { return std::get<1>(data_); }
    E&& errorValue() && { return std::get<1>(std::move(data_)); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v))
    {}

    std::variant<T, E> data_;
};

} // namespace EvoScope
