#ifndef DEEPEQ_ANY_VALUE_HPP
#define DEEPEQ_ANY_VALUE_HPP

#include <memory>
#include <type_traits>
#include <utility>

#include <deepeq/TypeDescriptor.hpp>

namespace deepeq {

/**
 * @brief Type-erased, immutable holder for a value of any describable type, or for nothing.
 *
 * Copies share the held value. Compared as a Polymorphic slot: two AnyValue are equal when both are empty,
 * or when both hold values of the same dynamic type that compare equal.
 *
 * @code
 * std::vector<deepeq::AnyValue> row{1, std::string("abc"), 3.14};
 * if (const auto* text = row[1].get_if<std::string>()) { ... }
 * @endcode
 */
class AnyValue {
    std::shared_ptr<const void> _value{};
    const TypeDescriptor*       _type = nullptr;

public:
    AnyValue() noexcept = default;

    template<typename T, typename Value = std::remove_cvref_t<T>>
    requires(!std::is_same_v<Value, AnyValue> && !std::is_array_v<Value> && Describable<Value>)
    AnyValue(T&& value) // NOSONAR implicit by design of a value holder
        : _value(std::make_shared<Value>(std::forward<T>(value))), _type(&descriptor_of<Value>()) {}

    [[nodiscard]] bool empty() const noexcept { return _type == nullptr; }
    explicit operator bool() const noexcept { return !empty(); }

    [[nodiscard]] const TypeDescriptor* type() const noexcept { return _type; }
    [[nodiscard]] ValueRef              ref() const noexcept { return empty() ? ValueRef{} : ValueRef(_value.get(), *_type); }

    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return ref().template get_if<T>();
    }

    void reset() noexcept {
        _value.reset();
        _type = nullptr;
    }
};

template<>
struct polymorphic_traits<AnyValue> {
    static ValueRef unwrap(const AnyValue& value) noexcept { return value.ref(); }
};

} // namespace deepeq

#endif // DEEPEQ_ANY_VALUE_HPP
