#pragma once

#include "Assert.h"

#include <utility>
#include <variant>

namespace GeneticCars {

/**
 * Holds either a value or an error.
 *
 * Example:
 *   Result<int, std::string> parse(const std::string& text);
 *   auto result = parse("42");
 *   if (result.isError()) {
 *       spdlog::error("parse failed: {}", result.errorValue());
 *   }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    T& value()
    {
        GENETICCARS_ASSERT(isValue(), "Result::value() called on an error result");
        return std::get<0>(data_);
    }

    const T& value() const
    {
        GENETICCARS_ASSERT(isValue(), "Result::value() called on an error result");
        return std::get<0>(data_);
    }

    E& errorValue()
    {
        GENETICCARS_ASSERT(isError(), "Result::errorValue() called on a value result");
        return std::get<1>(data_);
    }

    const E& errorValue() const
    {
        GENETICCARS_ASSERT(isError(), "Result::errorValue() called on a value result");
        return std::get<1>(data_);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> index, U&& value) : data_(index, std::forward<U>(value))
    {}

    // Index-based so that Result<std::string, std::string> stays unambiguous.
    std::variant<T, E> data_;
};

} // namespace GeneticCars
