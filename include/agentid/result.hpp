/**
 * @file result.hpp
 * @brief Tagged success/failure type used by the identity core
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <utility>
#include <variant>

namespace agentid {

/**
 * @brief Holds either a value of type T or an error of type E
 *
 * Failures stay values until a boundary decides how to report them.
 */
template <typename T, typename E>
class Result {
public:
    // Success constructors
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructors
    Result(const E& error) : data_(std::in_place_index<1>, error) {}
    Result(E&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool has_value() const { return data_.index() == 0; }
    bool has_error() const { return data_.index() == 1; }
    explicit operator bool() const { return has_value(); }

    /// @throws std::bad_variant_access if this holds an error
    const T& value() const { return std::get<0>(data_); }
    T& value() { return std::get<0>(data_); }

    /// @throws std::bad_variant_access if this holds a value
    const E& error() const { return std::get<1>(data_); }

private:
    std::variant<T, E> data_;
};

} // namespace agentid
