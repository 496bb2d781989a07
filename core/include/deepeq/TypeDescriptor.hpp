#ifndef DEEPEQ_TYPE_DESCRIPTOR_HPP
#define DEEPEQ_TYPE_DESCRIPTOR_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

#include <deepeq/meta/reflection.hpp>
#include <deepeq/meta/utils.hpp>

namespace deepeq {

/**
 * structural category of a type, selects the comparison rule applied by the EqualityEngine
 */
enum class Kind : std::uint8_t {
    Invalid = 0U,    ///< not describable
    Primitive,       ///< trivially copyable scalar-like value, compared bytewise
    String,          ///< contiguous character text
    Struct,          ///< fixed, named fields (reflectable classes, std::pair, std::tuple)
    Array,           ///< fixed-length homogeneous sequence (std::array, C arrays, fixed-extent std::span)
    DynamicSequence, ///< runtime-length homogeneous sequence (std::vector, std::span)
    AssociativeMap,  ///< key -> value container (std::map, std::unordered_map)
    Reference,       ///< possibly-null indirection (raw and smart pointers, std::reference_wrapper)
    Polymorphic,     ///< slot holding a value of varying dynamic type or nothing (std::optional, std::variant, AnyValue)
    Callable         ///< std::function and function pointers
};

/// kinds that can close a reference cycle or share storage and are thus tracked by the visited set
[[nodiscard]] constexpr bool isHardKind(Kind kind) noexcept {
    switch (kind) {
    case Kind::Reference:
    case Kind::DynamicSequence:
    case Kind::AssociativeMap:
    case Kind::Polymorphic: return true;
    default: return false;
    }
}

using TypeId = std::type_index;

struct TypeDescriptor;

/// lazily resolves a descriptor, allows recursive types to refer to themselves
using DescriptorGetter = const TypeDescriptor& (*)();

/**
 * non-owning view of a value: its address plus the descriptor of its exact type.
 * A default-constructed ValueRef denotes 'no value'.
 */
class ValueRef {
    const void*           _address = nullptr;
    const TypeDescriptor* _type    = nullptr;

public:
    constexpr ValueRef() noexcept = default;
    ValueRef(const void* address, const TypeDescriptor& type) noexcept : _address(address), _type(&type) { meta::precondition(address != nullptr); }

    template<typename T>
    [[nodiscard]] static ValueRef of(const T& value);

    [[nodiscard]] constexpr bool        valid() const noexcept { return _type != nullptr; }
    [[nodiscard]] constexpr const void* address() const noexcept { return _address; }
    [[nodiscard]] const TypeDescriptor& type() const noexcept {
        meta::precondition(valid());
        return *_type;
    }
    [[nodiscard]] Kind   kind() const noexcept;
    [[nodiscard]] TypeId typeId() const noexcept;

    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept;
};

struct FieldDescriptor {
    std::string_view name;
    DescriptorGetter type;
    const void* (*address)(const void* owner);
};

/**
 * runtime description of a type: identity, kind and the kind-specific accessors needed to walk a value of it.
 * Only the accessors matching `kind` are set, all others are nullptr.
 */
struct TypeDescriptor {
    using EntryVisitor = std::function<bool(const void* key, const void* value)>;

    struct SequenceOps {
        DescriptorGetter elementType = nullptr;
        std::size_t (*length)(const void*)              = nullptr;
        const void* (*element)(const void*, std::size_t) = nullptr;
        bool (*isNil)(const void*)                      = nullptr; // DynamicSequence only
        const void* (*storage)(const void*)             = nullptr; // DynamicSequence only
    };

    struct MapOps {
        DescriptorGetter keyType   = nullptr;
        DescriptorGetter valueType = nullptr;
        std::size_t (*length)(const void*)                        = nullptr;
        bool (*isNil)(const void*)                                = nullptr;
        const void* (*storage)(const void*)                       = nullptr;
        bool (*forEach)(const void* map, const EntryVisitor&)     = nullptr; ///< stops early and returns false once the visitor does
        const void* (*find)(const void* map, const void* key)     = nullptr; ///< address of the mapped value or nullptr
    };

    struct ReferenceOps {
        DescriptorGetter targetType = nullptr;
        const void* (*target)(const void*) = nullptr; ///< nullptr for a null reference
    };

    TypeId      id{typeid(void)};
    std::string name{};
    Kind        kind = Kind::Invalid;
    std::size_t size = 0UZ;

    std::span<const std::byte> (*bytes)(const void*) = nullptr; // Primitive
    std::string_view (*text)(const void*)            = nullptr; // String
    std::vector<FieldDescriptor> fields{};                       // Struct
    SequenceOps                  sequence{};                     // Array, DynamicSequence
    MapOps                       map{};                          // AssociativeMap
    ReferenceOps                 reference{};                    // Reference
    ValueRef (*unwrap)(const void*) = nullptr;                   // Polymorphic, returns an invalid ValueRef when empty
    bool (*isEmpty)(const void*)    = nullptr;                   // Callable
};

/**
 * customisation point making `T` a Polymorphic kind. Specialisations provide
 * `static ValueRef unwrap(const T&)` returning the currently held value or an invalid ValueRef.
 */
template<typename T>
struct polymorphic_traits {};

template<typename T>
concept polymorphic_type = requires(const T& value) {
    { polymorphic_traits<T>::unwrap(value) } -> std::same_as<ValueRef>;
};

namespace detail {

template<typename T>
struct is_std_function : std::false_type {};

template<typename Signature>
struct is_std_function<std::function<Signature>> : std::true_type {};

template<typename T>
concept string_type = (meta::is_instantiation_of<T, std::basic_string> && std::same_as<typename T::traits_type, std::char_traits<char>>) || std::same_as<T, std::string_view>;

template<typename T>
concept callable_type = is_std_function<T>::value || (std::is_pointer_v<T> && std::is_function_v<std::remove_pointer_t<T>>);

template<typename T>
concept reference_type = (std::is_pointer_v<T> && std::is_object_v<std::remove_pointer_t<T>> && !std::is_void_v<std::remove_cv_t<std::remove_pointer_t<T>>>) //
                         || (meta::smart_pointer_type<T> && !std::is_array_v<typename T::element_type>)                                                       //
                         || (meta::reference_wrapper_type<T> && std::is_object_v<typename T::type>);

template<typename T>
consteval Kind kind_of() {
    if constexpr (std::same_as<T, ValueRef> || std::is_reference_v<T> || std::is_const_v<T> || std::is_volatile_v<T>) {
        return Kind::Invalid;
    } else if constexpr (string_type<T>) {
        return Kind::String;
    } else if constexpr (callable_type<T>) {
        return Kind::Callable;
    } else if constexpr (reference_type<T>) {
        return Kind::Reference;
    } else if constexpr (polymorphic_type<T>) {
        return Kind::Polymorphic;
    } else if constexpr (meta::map_type<T>) {
        return Kind::AssociativeMap;
    } else if constexpr (meta::vector_type<T>) {
        return std::same_as<typename T::value_type, bool> ? Kind::Invalid : Kind::DynamicSequence; // std::vector<bool> has no addressable elements
    } else if constexpr (meta::dynamic_span_type<T>) {
        return Kind::DynamicSequence;
    } else if constexpr (meta::array_type<T> || meta::static_span_type<T> || std::is_bounded_array_v<T>) {
        return Kind::Array;
    } else if constexpr (refl::reflectable<T> || meta::pair_or_tuple_type<T>) {
        return Kind::Struct;
    } else if constexpr (std::is_trivially_copyable_v<T>) {
        return Kind::Primitive;
    } else {
        return Kind::Invalid;
    }
}

} // namespace detail

template<typename T>
concept Describable = detail::kind_of<std::remove_cv_t<T>>() != Kind::Invalid;

template<typename T>
const TypeDescriptor& descriptor_of();

namespace detail {

template<typename T>
const T& as(const void* ptr) noexcept {
    return *static_cast<const T*>(ptr);
}

template<typename T>
using element_type_of = std::remove_cvref_t<decltype(std::declval<const T&>()[0UZ])>;

template<typename T>
inline constexpr std::size_t static_length = [] {
    if constexpr (std::is_bounded_array_v<T>) {
        return std::extent_v<T>;
    } else if constexpr (meta::static_span_type<T>) {
        return T::extent;
    } else {
        return std::tuple_size_v<T>;
    }
}();

template<typename T>
struct reference_target {
    using type = typename std::pointer_traits<T>::element_type;
};

template<meta::reference_wrapper_type T>
struct reference_target<T> {
    using type = typename T::type;
};

template<typename T, std::size_t Idx>
FieldDescriptor reflectedField() {
    using Member = refl::data_member_type<T, Idx>;
    static_assert(Describable<Member>, "data member type is not describable");
    return {refl::data_member_name<T, Idx>.value.view(), &descriptor_of<Member>, //
        [](const void* owner) -> const void* { return std::addressof(refl::data_member<Idx>(as<T>(owner))); }};
}

template<typename T, std::size_t Idx>
FieldDescriptor tupleField() {
    using Member = std::remove_cvref_t<std::tuple_element_t<Idx, T>>;
    static_assert(Describable<Member>, "tuple element type is not describable");
    std::string_view name = meta::fixed_string_from_number<Idx>.view();
    if constexpr (meta::is_instantiation_of<T, std::pair>) {
        name = Idx == 0UZ ? "first" : "second";
    }
    return {name, &descriptor_of<Member>, [](const void* owner) -> const void* { return std::addressof(std::get<Idx>(as<T>(owner))); }};
}

template<typename T>
std::vector<FieldDescriptor> structFields() {
    if constexpr (refl::reflectable<T>) {
        return []<std::size_t... Is>(std::index_sequence<Is...>) { return std::vector<FieldDescriptor>{reflectedField<T, Is>()...}; }(std::make_index_sequence<refl::data_member_count<T>>());
    } else {
        return []<std::size_t... Is>(std::index_sequence<Is...>) { return std::vector<FieldDescriptor>{tupleField<T, Is>()...}; }(std::make_index_sequence<std::tuple_size_v<T>>());
    }
}

template<typename T>
TypeDescriptor makeDescriptor() {
    constexpr Kind kind = kind_of<T>();

    TypeDescriptor d;
    d.id   = TypeId(typeid(T));
    d.name = meta::type_name<T>();
    d.kind = kind;
    d.size = sizeof(T);

    if constexpr (kind == Kind::Primitive) {
        d.bytes = [](const void* ptr) -> std::span<const std::byte> {
            if constexpr (std::is_empty_v<T> || std::is_null_pointer_v<T>) {
                return {}; // no value representation, all instances are alike
            } else {
                return std::as_bytes(std::span<const T, 1UZ>(static_cast<const T*>(ptr), 1UZ));
            }
        };
    } else if constexpr (kind == Kind::String) {
        d.text = [](const void* ptr) -> std::string_view { return std::string_view(as<T>(ptr)); };
    } else if constexpr (kind == Kind::Struct) {
        d.fields = structFields<T>();
    } else if constexpr (kind == Kind::Array) {
        using Element = element_type_of<T>;
        d.sequence.elementType = &descriptor_of<Element>;
        d.sequence.length      = [](const void*) -> std::size_t { return static_length<T>; };
        d.sequence.element     = [](const void* ptr, std::size_t index) -> const void* { return std::addressof(as<T>(ptr)[index]); };
    } else if constexpr (kind == Kind::DynamicSequence) {
        using Element = element_type_of<T>;
        d.sequence.elementType = &descriptor_of<Element>;
        d.sequence.length      = [](const void* ptr) -> std::size_t { return as<T>(ptr).size(); };
        d.sequence.element     = [](const void* ptr, std::size_t index) -> const void* { return std::addressof(as<T>(ptr)[index]); };
        d.sequence.storage     = [](const void* ptr) -> const void* { return as<T>(ptr).data(); };
        if constexpr (meta::dynamic_span_type<T>) {
            d.sequence.isNil = [](const void* ptr) { return as<T>(ptr).data() == nullptr; };
        } else {
            d.sequence.isNil = [](const void*) { return false; };
        }
    } else if constexpr (kind == Kind::AssociativeMap) {
        using Key   = typename T::key_type;
        using Value = typename T::mapped_type;
        d.map.keyType   = &descriptor_of<Key>;
        d.map.valueType = &descriptor_of<Value>;
        d.map.length    = [](const void* ptr) -> std::size_t { return as<T>(ptr).size(); };
        d.map.isNil     = [](const void*) { return false; };
        d.map.storage   = [](const void* ptr) { return ptr; };
        d.map.forEach   = [](const void* ptr, const TypeDescriptor::EntryVisitor& visit) {
            for (const auto& entry : as<T>(ptr)) {
                if (!visit(std::addressof(entry.first), std::addressof(entry.second))) {
                    return false;
                }
            }
            return true;
        };
        d.map.find = [](const void* ptr, const void* key) -> const void* {
            const auto& map = as<T>(ptr);
            const auto  it  = map.find(as<Key>(key));
            return it == map.end() ? nullptr : std::addressof(it->second);
        };
    } else if constexpr (kind == Kind::Reference) {
        using Target = std::remove_cv_t<typename reference_target<T>::type>;
        d.reference.targetType = &descriptor_of<Target>;
        d.reference.target     = [](const void* ptr) -> const void* {
            if constexpr (std::is_pointer_v<T>) {
                return as<T>(ptr);
            } else if constexpr (meta::reference_wrapper_type<T>) {
                return std::addressof(as<T>(ptr).get()); // never null
            } else {
                return as<T>(ptr).get();
            }
        };
    } else if constexpr (kind == Kind::Polymorphic) {
        d.unwrap = [](const void* ptr) { return polymorphic_traits<T>::unwrap(as<T>(ptr)); };
    } else if constexpr (kind == Kind::Callable) {
        d.isEmpty = [](const void* ptr) {
            if constexpr (std::is_pointer_v<T>) {
                return as<T>(ptr) == nullptr;
            } else {
                return !static_cast<bool>(as<T>(ptr));
            }
        };
    }
    return d;
}

} // namespace detail

/**
 * @return the process-wide descriptor of `T` (cv-qualifiers are ignored), built on first use
 */
template<typename T>
const TypeDescriptor& descriptor_of() {
    using Type = std::remove_cv_t<T>;
    if constexpr (!std::is_same_v<Type, T>) {
        return descriptor_of<Type>();
    } else {
        static_assert(Describable<T>, "type is neither primitive, nor a supported container, nor made reflectable via DEEPEQ_MAKE_REFLECTABLE");
        static const TypeDescriptor descriptor = detail::makeDescriptor<T>();
        return descriptor;
    }
}

template<typename T>
ValueRef ValueRef::of(const T& value) {
    return ValueRef(std::addressof(value), descriptor_of<T>());
}

inline Kind ValueRef::kind() const noexcept { return valid() ? _type->kind : Kind::Invalid; }

inline TypeId ValueRef::typeId() const noexcept { return valid() ? _type->id : TypeId(typeid(void)); }

template<typename T>
const T* ValueRef::get_if() const noexcept {
    return valid() && _type->id == TypeId(typeid(std::remove_cv_t<T>)) ? static_cast<const T*>(_address) : nullptr;
}

template<typename T>
struct polymorphic_traits<std::optional<T>> {
    static ValueRef unwrap(const std::optional<T>& value) { return value.has_value() ? ValueRef::of(*value) : ValueRef{}; }
};

template<typename... Ts>
struct polymorphic_traits<std::variant<Ts...>> {
    static ValueRef unwrap(const std::variant<Ts...>& value) {
        if (value.valueless_by_exception()) {
            return {};
        }
        return std::visit([](const auto& alternative) { return ValueRef::of(alternative); }, value);
    }
};

} // namespace deepeq

#endif // DEEPEQ_TYPE_DESCRIPTOR_HPP
