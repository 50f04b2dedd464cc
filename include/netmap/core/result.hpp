/**
 * @file result.hpp
 * @brief Success-or-reason result type for non-fatal operations.
 *
 * Credential, protocol and fact-group failures are expected during discovery.
 * They travel as values of this type instead of exceptions so the caller can
 * see in the signature that a failure is recoverable.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace netmap {
namespace core {

/**
 * @class Result
 * @brief Holds either a value or an error message.
 *
 * Usage:
 * @code
 * Result<std::vector<VarBind>> rows = client.walk(oid);
 * if (!rows) {
 *     LOG_DEBUG("SnmpProbe", "walk failed: {}", rows.error());
 *     return {};
 * }
 * for (const auto& vb : *rows) { ... }
 * @endcode
 */
template<typename T>
class Result {
public:
    using value_type = T;

    static Result success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result failure(std::string error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_);
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_);
        }
        return *value_;
    }

    const T& operator*() const { return value(); }
    T& operator*() { return value(); }
    const T* operator->() const { return &value(); }

    T valueOr(T fallback) const { return value_ ? *value_ : std::move(fallback); }

    const std::string& error() const { return error_; }

private:
    Result() = default;

    std::optional<T> value_;
    std::string error_;
};

}  // namespace core
}  // namespace netmap
