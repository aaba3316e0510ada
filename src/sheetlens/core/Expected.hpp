#pragma once

#include "sheetlens/core/ErrorCode.hpp"
#include <new>
#include <type_traits>
#include <utility>

namespace sheetlens {
namespace core {

/**
 * @brief Expected<T, E> - 值或错误
 *
 * 解析与编辑路径上的所有可失败操作都返回它，调用方决定是检查错误
 * 还是通过 valueOrThrow() 转为异常。
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

    void destroy() noexcept {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

public:
    using value_type = T;
    using error_type = E;

    Expected(const T& value) : has_value_(true) {
        new(&value_) T(value);
    }

    Expected(T&& value) : has_value_(true) {
        new(&value_) T(std::move(value));
    }

    Expected(const E& error) : has_value_(false) {
        new(&error_) E(error);
    }

    Expected(E&& error) : has_value_(false) {
        new(&error_) E(std::move(error));
    }

    Expected(const Expected& other) : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(other.value_);
        } else {
            new(&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(std::move(other.value_));
        } else {
            new(&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(other.value_);
            } else {
                new(&error_) E(other.error_);
            }
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(std::move(other.value_));
            } else {
                new(&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 访问（调用方负责先检查状态） ==========

    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    const T& valueOr(const T& default_value) const & noexcept {
        return has_value_ ? value_ : default_value;
    }

    T valueOr(T&& default_value) && {
        return has_value_ ? std::move(value_) : std::move(default_value);
    }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

    // ========== 函数式操作 ==========

    template<typename F>
    auto map(F&& func) const -> Expected<decltype(func(value_)), E> {
        if (has_value_) {
            return Expected<decltype(func(value_)), E>(func(value_));
        }
        return Expected<decltype(func(value_)), E>(error_);
    }

    template<typename F>
    auto andThen(F&& func) const -> decltype(func(value_)) {
        if (has_value_) {
            return func(value_);
        }
        return decltype(func(value_))(error_);
    }

    T& valueOrThrow() & {
        if (!has_value_) {
            raise();
        }
        return value_;
    }

    T valueOrThrow() && {
        if (!has_value_) {
            raise();
        }
        return std::move(value_);
    }

private:
    [[noreturn]] void raise() const {
        if constexpr (std::is_same_v<E, Error>) {
            throwError(error_);
        } else {
            throw E(error_);
        }
    }
};

/**
 * @brief 特化：无返回值的操作
 */
template<typename E>
class Expected<void, E> {
private:
    E error_;
    bool has_value_;

public:
    using value_type = void;
    using error_type = E;

    Expected() : has_value_(true) {}

    Expected(const E& error) : error_(error), has_value_(false) {}
    Expected(E&& error) : error_(std::move(error)), has_value_(false) {}

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    void valueOrThrow() const {
        if (!has_value_) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error_);
            } else {
                throw E(error_);
            }
        }
    }
};

// ========== 类型别名 ==========

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

}} // namespace sheetlens::core
