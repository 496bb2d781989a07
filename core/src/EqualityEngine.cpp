#include <deepeq/EqualityEngine.hpp>
#include <deepeq/formatter/TypeDescriptorFormatter.hpp>
#include <deepeq/meta/formatter.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

namespace deepeq {

EngineConfig EngineConfig::fromEnvironment(EngineConfig config) {
    if (const char* env = std::getenv("DEEPEQ_MAX_DEPTH"); env != nullptr) {
        const std::string_view text(env);
        std::size_t            value = 0UZ;
        const auto [ptr, ec]         = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            config.maxDepth = value;
        } else {
            std::println(stderr, "deepeq: ignoring malformed DEEPEQ_MAX_DEPTH='{}', keeping maxDepth={}", text, config.maxDepth);
        }
    }
    if (const char* env = std::getenv("DEEPEQ_TRACE"); env != nullptr) {
        const std::string_view text(env);
        if (text == "1" || text == "true" || text == "on") {
            config.trace = true;
        } else if (text == "0" || text == "false" || text == "off") {
            config.trace = false;
        } else {
            std::println(stderr, "deepeq: ignoring malformed DEEPEQ_TRACE='{}', keeping trace={}", text, config.trace);
        }
    }
    return config;
}

namespace {

// canonical (unordered) address pair plus the type both addresses are viewed as
struct VisitKey {
    std::uintptr_t first;
    std::uintptr_t second;
    TypeId         type;

    bool operator==(const VisitKey&) const = default;
};

struct VisitKeyHash {
    std::size_t operator()(const VisitKey& key) const noexcept {
        std::size_t hash = std::hash<std::uintptr_t>{}(key.first);
        hash ^= std::hash<std::uintptr_t>{}(key.second) + 0x9e3779b9UZ + (hash << 6) + (hash >> 2);
        hash ^= std::hash<TypeId>{}(key.type) + 0x9e3779b9UZ + (hash << 6) + (hash >> 2);
        return hash;
    }
};

class Comparison {
    const OverrideRegistry*                      _registry;
    const EngineConfig&                          _config;
    std::unordered_set<VisitKey, VisitKeyHash>   _visited{};
    std::vector<std::string>                     _path{}; // only maintained while tracing

    class PathSegment {
        Comparison& _comparison;
        bool        _active;

    public:
        template<typename... Args>
        PathSegment(Comparison& comparison, std::format_string<Args...> fmt, Args&&... args) : _comparison(comparison), _active(comparison._config.trace) {
            if (_active) {
                _comparison._path.push_back(std::format(fmt, std::forward<Args>(args)...));
            }
        }
        PathSegment(const PathSegment&)            = delete;
        PathSegment& operator=(const PathSegment&) = delete;
        ~PathSegment() {
            if (_active) {
                _comparison._path.pop_back();
            }
        }
    };

public:
    Comparison(const OverrideRegistry* registry, const EngineConfig& config) : _registry(registry), _config(config) {}

    bool compare(ValueRef lhs, ValueRef rhs) {
        if (!lhs.valid() || !rhs.valid()) {
            if (lhs.valid() == rhs.valid()) {
                return true;
            }
            return mismatch(lhs.valid() ? lhs : rhs, "only one side holds a value");
        }
        return valuesEqual(lhs, rhs, 0UZ);
    }

private:
    [[nodiscard]] std::string path() const { return _path.empty() ? std::string("<root>") : join(_path, ""); }

    template<typename... Args>
    bool mismatch(ValueRef where, std::format_string<Args...> fmt, Args&&... args) const {
        if (_config.trace) {
            std::println(stderr, "deepeq: mismatch at '{}' ({}): {}", path(), where, std::format(fmt, std::forward<Args>(args)...));
        }
        return false;
    }

    bool alreadyVisited(ValueRef lhs, ValueRef rhs) {
        auto first  = reinterpret_cast<std::uintptr_t>(lhs.address());
        auto second = reinterpret_cast<std::uintptr_t>(rhs.address());
        if (first > second) {
            std::swap(first, second);
        }
        return !_visited.insert(VisitKey{first, second, lhs.typeId()}).second;
    }

    bool valuesEqual(ValueRef lhs, ValueRef rhs, std::size_t depth) {
        const TypeDescriptor& type = lhs.type();
        if (type.id != rhs.typeId()) {
            return mismatch(lhs, "type differs from '{}'", rhs.type().name);
        }
        if (_config.maxDepth > 0UZ && depth > _config.maxDepth) {
            throw exception(std::format("comparison exceeds maxDepth={} at '{}' ({})", _config.maxDepth, path(), type.name));
        }

        if (_registry != nullptr) {
            if (const auto predicate = _registry->lookup(type.id)) {
                return (*predicate)(lhs.address(), rhs.address()) || mismatch(lhs, "rejected by registered equivalence");
            }
        }

        if (isHardKind(type.kind) && alreadyVisited(lhs, rhs)) {
            return true; // pair is already being compared further up, assume equal
        }

        const void* l = lhs.address();
        const void* r = rhs.address();
        switch (type.kind) {
        case Kind::Array: return elementsEqual(type.sequence, l, r, type.sequence.length(l), depth);
        case Kind::DynamicSequence: {
            const auto& ops = type.sequence;
            if (ops.isNil(l) != ops.isNil(r)) {
                return mismatch(lhs, "nil vs. non-nil sequence");
            }
            const std::size_t length = ops.length(l);
            if (length != ops.length(r)) {
                return mismatch(lhs, "length {} vs. {}", length, ops.length(r));
            }
            if (ops.storage(l) == ops.storage(r)) {
                return true;
            }
            return elementsEqual(ops, l, r, length, depth);
        }
        case Kind::Polymorphic: {
            const ValueRef lhsValue = type.unwrap(l);
            const ValueRef rhsValue = type.unwrap(r);
            if (!lhsValue.valid() || !rhsValue.valid()) {
                return lhsValue.valid() == rhsValue.valid() || mismatch(lhs, "empty vs. non-empty");
            }
            PathSegment segment(*this, "@");
            return valuesEqual(lhsValue, rhsValue, depth + 1UZ);
        }
        case Kind::Reference: {
            const void* lhsTarget = type.reference.target(l);
            const void* rhsTarget = type.reference.target(r);
            if (lhsTarget == rhsTarget) {
                return true;
            }
            if (lhsTarget == nullptr || rhsTarget == nullptr) {
                return mismatch(lhs, "null vs. non-null reference");
            }
            const TypeDescriptor& target = type.reference.targetType();
            PathSegment           segment(*this, "*");
            return valuesEqual(ValueRef(lhsTarget, target), ValueRef(rhsTarget, target), depth + 1UZ);
        }
        case Kind::Struct:
            return std::ranges::all_of(type.fields, [&](const FieldDescriptor& field) {
                const TypeDescriptor& fieldType = field.type();
                PathSegment           segment(*this, ".{}", field.name);
                return valuesEqual(ValueRef(field.address(l), fieldType), ValueRef(field.address(r), fieldType), depth + 1UZ);
            });
        case Kind::AssociativeMap: {
            const auto& ops = type.map;
            if (ops.isNil(l) != ops.isNil(r)) {
                return mismatch(lhs, "nil vs. non-nil map");
            }
            const std::size_t length = ops.length(l);
            if (length != ops.length(r)) {
                return mismatch(lhs, "size {} vs. {}", length, ops.length(r));
            }
            if (ops.storage(l) == ops.storage(r)) {
                return true;
            }
            const TypeDescriptor& valueType = ops.valueType();
            std::size_t           entry     = 0UZ;
            return ops.forEach(l, [&](const void* key, const void* value) {
                PathSegment segment(*this, "{{#{}}}", entry++);
                const void* other = ops.find(r, key);
                if (other == nullptr) {
                    return mismatch(lhs, "key missing on the right-hand side");
                }
                return valuesEqual(ValueRef(value, valueType), ValueRef(other, valueType), depth + 1UZ);
            });
        }
        case Kind::Callable: return (type.isEmpty(l) && type.isEmpty(r)) || mismatch(lhs, "non-empty callables are never equal");
        case Kind::String: return type.text(l) == type.text(r) || mismatch(lhs, "text differs");
        case Kind::Primitive: return std::ranges::equal(type.bytes(l), type.bytes(r)) || mismatch(lhs, "value differs");
        case Kind::Invalid: break;
        }
        throw exception(std::format("type '{}' has no comparable kind", type.name));
    }

    bool elementsEqual(const TypeDescriptor::SequenceOps& ops, const void* lhs, const void* rhs, std::size_t length, std::size_t depth) {
        const TypeDescriptor& elementType = ops.elementType();
        for (std::size_t i = 0UZ; i < length; ++i) {
            PathSegment segment(*this, "[{}]", i);
            if (!valuesEqual(ValueRef(ops.element(lhs, i), elementType), ValueRef(ops.element(rhs, i), elementType), depth + 1UZ)) {
                return false;
            }
        }
        return true;
    }
};

} // namespace

bool EqualityEngine::compare(ValueRef lhs, ValueRef rhs) const {
    Comparison comparison(_registry, _config);
    return comparison.compare(lhs, rhs);
}

std::expected<bool, Error> EqualityEngine::tryCompare(ValueRef lhs, ValueRef rhs) const noexcept {
    auto failed = [this](Error error) -> std::expected<bool, Error> {
        if (_config.trace) {
            std::println(stderr, "deepeq: {} comparison aborted in '{}': {}", error.isoTime(), error.methodName(), error);
        }
        return std::unexpected(std::move(error));
    };
    try {
        return compare(lhs, rhs);
    } catch (const deepeq::exception& e) {
        return failed(Error(e));
    } catch (const std::exception& e) {
        return failed(Error(e));
    }
}

} // namespace deepeq
