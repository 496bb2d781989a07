#include <deepeq/OverrideRegistry.hpp>

namespace deepeq {

using ReaderWriterLockType::READ;
using ReaderWriterLockType::WRITE;

OverrideRegistry::OverrideRegistry(const OverrideRegistry& other) {
    auto guard  = other._lock.scopedGuard<READ>();
    _predicates = other._predicates;
}

OverrideRegistry& OverrideRegistry::operator=(const OverrideRegistry& other) {
    if (this == &other) {
        return *this;
    }
    auto snapshot = [&other] {
        auto guard = other._lock.scopedGuard<READ>();
        return other._predicates;
    }();
    std::lock_guard writer(_writeMutex);
    auto            guard = _lock.scopedGuard<WRITE>();
    _predicates           = std::move(snapshot);
    return *this;
}

void OverrideRegistry::insert(TypeId type, Predicate predicate) {
    auto            shared = std::make_shared<const Predicate>(std::move(predicate));
    std::lock_guard writer(_writeMutex);
    auto            guard = _lock.scopedGuard<WRITE>();
    _predicates.insert_or_assign(type, std::move(shared));
}

std::shared_ptr<const OverrideRegistry::Predicate> OverrideRegistry::lookup(TypeId type) const {
    auto guard = _lock.scopedGuard<READ>();
    if (const auto it = _predicates.find(type); it != _predicates.end()) {
        return it->second;
    }
    return nullptr;
}

bool OverrideRegistry::contains(TypeId type) const {
    auto guard = _lock.scopedGuard<READ>();
    return _predicates.contains(type);
}

bool OverrideRegistry::unregister(TypeId type) {
    std::lock_guard writer(_writeMutex);
    auto            guard = _lock.scopedGuard<WRITE>();
    return _predicates.erase(type) > 0UZ;
}

void OverrideRegistry::clear() {
    std::lock_guard writer(_writeMutex);
    auto            guard = _lock.scopedGuard<WRITE>();
    _predicates.clear();
}

std::size_t OverrideRegistry::size() const {
    auto guard = _lock.scopedGuard<READ>();
    return _predicates.size();
}

} // namespace deepeq
