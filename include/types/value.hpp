#pragma once

#include <optional>
#include <stdexcept>
#include <utility>

namespace plonkish {

/**
 * Value - A value that may or may not be known to the current pass
 *
 * Key generation never sees witnesses, so every advice value there is unknown.
 * The witness layouter sees concrete values wherever circuit code supplied them.
 */
template<typename T>
class Value {
public:
    Value() = default;

    static Value known(T value) { return Value(std::move(value)); }
    static Value unknown() { return Value(); }

    bool is_known() const { return inner_.has_value(); }

    // Throws std::logic_error when unknown
    const T& get() const {
        if (!inner_) {
            throw std::logic_error("Value::get on an unknown value");
        }
        return *inner_;
    }

    T value_or(T fallback) const {
        return inner_ ? *inner_ : fallback;
    }

    template<typename F>
    auto map(F&& f) const -> Value<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (!inner_) {
            return Value<U>::unknown();
        }
        return Value<U>::known(f(*inner_));
    }

    bool operator==(const Value& rhs) const { return inner_ == rhs.inner_; }
    bool operator!=(const Value& rhs) const { return inner_ != rhs.inner_; }

private:
    explicit Value(T value) : inner_(std::move(value)) {}

    std::optional<T> inner_;
};

} // namespace plonkish
