#ifndef DEEPEQ_EQUALITY_ENGINE_HPP
#define DEEPEQ_EQUALITY_ENGINE_HPP

#include <cstddef>
#include <expected>
#include <type_traits>

#include <deepeq/AnyValue.hpp>
#include <deepeq/Error.hpp>
#include <deepeq/OverrideRegistry.hpp>
#include <deepeq/TypeDescriptor.hpp>
#include <deepeq/meta/reflection.hpp>

namespace deepeq {

struct EngineConfig {
    std::size_t maxDepth = 0UZ;   ///< maximum recursion depth of a single comparison, 0: unbounded
    bool        trace    = false; ///< log the first mismatch found to stderr

    DEEPEQ_MAKE_REFLECTABLE(EngineConfig, maxDepth, trace);

    /**
     * @return `defaults` updated from the environment variables DEEPEQ_MAX_DEPTH (unsigned integer) and
     * DEEPEQ_TRACE (1/0, true/false, on/off). Malformed values are reported and ignored.
     */
    [[nodiscard]] static EngineConfig fromEnvironment(EngineConfig defaults = {});
};

namespace detail {
template<typename T>
ValueRef toValueRef(const T& value) {
    if constexpr (std::is_same_v<T, ValueRef>) {
        return value;
    } else if constexpr (std::is_same_v<T, AnyValue>) {
        return value.ref();
    } else if constexpr (std::is_null_pointer_v<T>) {
        return {};
    } else {
        return ValueRef::of(value);
    }
}
} // namespace detail

/**
 * @brief Generic structural deep-equality.
 *
 * Two values are equal when they have the same exact type and, depending on that type's Kind:
 *  - Primitive: identical object representation (bytewise),
 *  - String: identical text,
 *  - Struct: all fields pairwise equal, in declaration order and regardless of access,
 *  - Array: all elements pairwise equal,
 *  - DynamicSequence: same nil-ness and length, and either the same storage or all elements pairwise equal,
 *  - AssociativeMap: same nil-ness and size, and either the same storage or each key of one maps to an equal value in the other,
 *  - Reference: same target, or both non-null with equal targets,
 *  - Polymorphic: both empty, or both holding equal values of the same dynamic type,
 *  - Callable: only when both are empty.
 * A predicate registered in the OverrideRegistry for a type replaces all of the above for that type.
 *
 * N.B. `const char*` is a Reference to a single `char`: two C strings are equal when their first characters
 * are, e.g. "abc" equals "axy". Compare text as std::string or std::string_view.
 *
 * Cyclic values terminate: a pair of Reference, DynamicSequence, AssociativeMap or Polymorphic values
 * re-encountered within the same comparison is assumed equal.
 *
 * The engine keeps no state between comparisons and may be shared between threads.
 */
class EqualityEngine {
    const OverrideRegistry* _registry = nullptr;
    EngineConfig            _config{};

public:
    using Config = EngineConfig;

    explicit EqualityEngine(EngineConfig config = {}) noexcept : _config(config) {}
    explicit EqualityEngine(const OverrideRegistry& registry, EngineConfig config = {}) noexcept : _registry(&registry), _config(config) {}
    EqualityEngine(const OverrideRegistry&&, EngineConfig = {}) = delete;

    [[nodiscard]] const EngineConfig&     config() const noexcept { return _config; }
    [[nodiscard]] const OverrideRegistry* registry() const noexcept { return _registry; }

    /**
     * compares two values. An invalid ValueRef (or an empty AnyValue, or nullptr at the top level) denotes
     * 'no value': two of them are equal, while 'no value' never equals an actual value.
     *
     * @throws deepeq::exception if the comparison exceeds `EngineConfig::maxDepth`
     */
    [[nodiscard]] bool compare(ValueRef lhs, ValueRef rhs) const;

    template<typename T, typename U>
    [[nodiscard]] bool compare(const T& lhs, const U& rhs) const {
        return compare(detail::toValueRef(lhs), detail::toValueRef(rhs));
    }

    /// non-throwing variant of compare(...)
    [[nodiscard]] std::expected<bool, Error> tryCompare(ValueRef lhs, ValueRef rhs) const noexcept;

    template<typename T, typename U>
    [[nodiscard]] std::expected<bool, Error> tryCompare(const T& lhs, const U& rhs) const noexcept {
        return tryCompare(detail::toValueRef(lhs), detail::toValueRef(rhs));
    }
};

/// structural deep equality without overrides
template<typename T, typename U>
[[nodiscard]] bool deepEqual(const T& lhs, const U& rhs) {
    return EqualityEngine{}.compare(lhs, rhs);
}

} // namespace deepeq

#endif // DEEPEQ_EQUALITY_ENGINE_HPP
