#ifndef DEEPEQ_OVERRIDE_REGISTRY_HPP
#define DEEPEQ_OVERRIDE_REGISTRY_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <deepeq/ReaderWriterLock.hpp>
#include <deepeq/TypeDescriptor.hpp>

namespace deepeq {

/**
 * @brief Maps an exact type to a user-supplied equivalence predicate that replaces structural comparison.
 *
 * A registered predicate is consulted for every value pair of that type, at the top level and nested
 * anywhere inside larger values, and its verdict is final: the engine does not recurse into such values.
 * Registering again for the same type replaces the previous predicate.
 *
 * Registration and lookup may happen concurrently. Registration while a comparison is in flight is
 * well-defined but the comparison may observe either the old or the new predicate.
 *
 * @code
 * deepeq::OverrideRegistry registry;
 * registry.registerEquivalence<Time>([](const Time& a, const Time& b) { return floor<seconds>(a) == floor<seconds>(b); });
 * @endcode
 */
class OverrideRegistry {
public:
    using Predicate = std::function<bool(const void* lhs, const void* rhs)>;

private:
    mutable ReaderWriterLock                                      _lock;       // lookups vs. modifications
    std::mutex                                                    _writeMutex; // modifications among each other
    std::unordered_map<TypeId, std::shared_ptr<const Predicate>> _predicates;

    void insert(TypeId type, Predicate predicate);

public:
    OverrideRegistry() = default;
    OverrideRegistry(const OverrideRegistry& other);
    OverrideRegistry& operator=(const OverrideRegistry& other);

    template<typename T, typename Fn>
    requires Describable<T> && std::is_invocable_r_v<bool, std::decay_t<Fn>&, const T&, const T&>
    void registerEquivalence(Fn&& predicate) {
        if constexpr (std::is_constructible_v<bool, const std::decay_t<Fn>&>) {
            meta::precondition(static_cast<bool>(predicate)); // an empty predicate can never be invoked
        }
        insert(TypeId(typeid(std::remove_cv_t<T>)), Predicate([equal = std::forward<Fn>(predicate)](const void* lhs, const void* rhs) mutable -> bool { //
            return std::invoke(equal, *static_cast<const T*>(lhs), *static_cast<const T*>(rhs));
        }));
    }

    /// @return the predicate registered for `type`, or nullptr if there is none
    [[nodiscard]] std::shared_ptr<const Predicate> lookup(TypeId type) const;

    [[nodiscard]] bool contains(TypeId type) const;
    template<typename T>
    [[nodiscard]] bool contains() const {
        return contains(TypeId(typeid(std::remove_cv_t<T>)));
    }

    /// @return true if a predicate was registered and has been removed
    bool unregister(TypeId type);
    template<typename T>
    bool unregister() {
        return unregister(TypeId(typeid(std::remove_cv_t<T>)));
    }

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool        empty() const { return size() == 0UZ; }
};

} // namespace deepeq

#endif // DEEPEQ_OVERRIDE_REGISTRY_HPP
