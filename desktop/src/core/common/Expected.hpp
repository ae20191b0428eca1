#pragma once

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace MomentNav {

template<typename E>
class Unexpected {
public:
    constexpr explicit Unexpected(const E& error) : error_(error) {}
    constexpr explicit Unexpected(E&& error) : error_(std::move(error)) {}

    constexpr const E& error() const& { return error_; }
    constexpr E& error() & { return error_; }
    constexpr E&& error() && { return std::move(error_); }

private:
    E error_;
};

template<typename E>
constexpr Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

// Value-or-error result, modelled on std::expected (C++23).
// The error alternative is only reachable through Unexpected or a type
// that converts to E but not to T.
template<typename T, typename E>
class Expected {
public:
    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() : storage_(std::in_place_index<0>) {}

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        !std::is_same_v<std::decay_t<U>, Unexpected<E>> &&
        std::is_constructible_v<T, U>>>
    Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

    template<typename G, typename = std::enable_if_t<
        std::is_constructible_v<E, const G&> &&
        !std::is_constructible_v<T, const G&> &&
        !std::is_same_v<std::decay_t<G>, Expected>>>
    Expected(const G& error) : storage_(std::in_place_index<1>, error) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return storage_.index() == 0; }
    bool hasError() const noexcept { return storage_.index() == 1; }

    explicit operator bool() const noexcept { return hasValue(); }

    const T& value() const& {
        if (!hasValue()) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return std::get<0>(storage_);
    }

    T& value() & {
        if (!hasValue()) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return std::get<0>(storage_);
    }

    T&& value() && {
        if (!hasValue()) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return std::get<0>(std::move(storage_));
    }

    const E& error() const& {
        if (hasValue()) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return std::get<1>(storage_);
    }

    E& error() & {
        if (hasValue()) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return std::get<1>(storage_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    template<typename F>
    auto andThen(F&& f) const& -> std::invoke_result_t<F, const T&> {
        if (hasValue()) {
            return std::forward<F>(f)(value());
        }
        return makeUnexpected(error());
    }

    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        if (hasValue()) {
            return Expected<std::invoke_result_t<F, const T&>, E>(std::forward<F>(f)(value()));
        }
        return makeUnexpected(error());
    }

    template<typename U>
    T valueOr(U&& defaultValue) const& {
        return hasValue() ? value() : static_cast<T>(std::forward<U>(defaultValue));
    }

private:
    std::variant<T, E> storage_;
};

// Success carries no payload.
template<typename E>
class Expected<void, E> {
public:
    Expected() = default;

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : error_(unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : error_(std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return !error_.has_value(); }
    bool hasError() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return hasValue(); }

    const E& error() const& {
        if (!error_) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return *error_;
    }

private:
    std::optional<E> error_;
};

} // namespace MomentNav
