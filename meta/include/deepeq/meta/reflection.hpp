#ifndef DEEPEQ_REFLECTION_HPP
#define DEEPEQ_REFLECTION_HPP

#include <deepeq/meta/utils.hpp>

#include <concepts>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

// recursive macro implementation inspired by https://www.scs.stanford.edu/~dm/blog/va-opt.html

#define DEEPEQ_REFLECT_PARENS ()

#define DEEPEQ_REFLECT_EXPAND(...)  DEEPEQ_REFLECT_EXPAND3(DEEPEQ_REFLECT_EXPAND3(DEEPEQ_REFLECT_EXPAND3(DEEPEQ_REFLECT_EXPAND3(__VA_ARGS__))))
#define DEEPEQ_REFLECT_EXPAND3(...) DEEPEQ_REFLECT_EXPAND2(DEEPEQ_REFLECT_EXPAND2(DEEPEQ_REFLECT_EXPAND2(DEEPEQ_REFLECT_EXPAND2(__VA_ARGS__))))
#define DEEPEQ_REFLECT_EXPAND2(...) DEEPEQ_REFLECT_EXPAND1(DEEPEQ_REFLECT_EXPAND1(DEEPEQ_REFLECT_EXPAND1(DEEPEQ_REFLECT_EXPAND1(__VA_ARGS__))))
#define DEEPEQ_REFLECT_EXPAND1(...) __VA_ARGS__

#define DEEPEQ_REFLECT_TO_STRINGS(...)         __VA_OPT__(DEEPEQ_REFLECT_EXPAND(DEEPEQ_REFLECT_TO_STRINGS_IMPL(__VA_ARGS__)))
#define DEEPEQ_REFLECT_TO_STRINGS_IMPL(x, ...) ::deepeq::meta::constexpr_string<#x>() __VA_OPT__(, DEEPEQ_REFLECT_TO_STRINGS_AGAIN DEEPEQ_REFLECT_PARENS(__VA_ARGS__))
#define DEEPEQ_REFLECT_TO_STRINGS_AGAIN()      DEEPEQ_REFLECT_TO_STRINGS_IMPL

#define DEEPEQ_REFLECT_COUNT_ARGS(...)         0 __VA_OPT__(+DEEPEQ_REFLECT_EXPAND(DEEPEQ_REFLECT_COUNT_ARGS_IMPL(__VA_ARGS__)))
#define DEEPEQ_REFLECT_COUNT_ARGS_IMPL(x, ...) 1 __VA_OPT__(+DEEPEQ_REFLECT_COUNT_ARGS_AGAIN DEEPEQ_REFLECT_PARENS(__VA_ARGS__))
#define DEEPEQ_REFLECT_COUNT_ARGS_AGAIN()      DEEPEQ_REFLECT_COUNT_ARGS_IMPL

/**
 * Declares the data members of a class for deepeq's compile-time reflection. Must be placed inside the class
 * body so that private and protected members can be listed as well. Members of reflectable base classes are
 * picked up automatically and precede the derived class' own members.
 *
 * @code
 * struct Point {
 *     int x;
 *     int y;
 *     DEEPEQ_MAKE_REFLECTABLE(Point, x, y);
 * };
 * @endcode
 */
#define DEEPEQ_MAKE_REFLECTABLE(T, ...)                                                                                                                                             \
    friend void* deepeq_refl_determine_base_type(T const&, ...) { return nullptr; }                                                                                                 \
                                                                                                                                                                                    \
    template<std::derived_from<T> DeepEqRefl_U>                                                                                                                                     \
    requires(not std::is_same_v<DeepEqRefl_U, T>) and std::is_void_v<std::remove_pointer_t<decltype(deepeq_refl_determine_base_type(std::declval<::deepeq::refl::detail::make_dependent_t<DeepEqRefl_U, T>>(), 0))>> \
    friend T* deepeq_refl_determine_base_type(DeepEqRefl_U const&, int) {                                                                                                          \
        return nullptr;                                                                                                                                                             \
    }                                                                                                                                                                               \
                                                                                                                                                                                    \
    template<std::derived_from<T> DeepEqRefl_U, typename DeepEqRefl_Not>                                                                                                            \
    requires(not std::is_same_v<DeepEqRefl_U, T>) and (not std::derived_from<DeepEqRefl_Not, T>) and std::is_void_v<std::remove_pointer_t<decltype(deepeq_refl_determine_base_type(std::declval<::deepeq::refl::detail::make_dependent_t<DeepEqRefl_U, T>>(), std::declval<DeepEqRefl_Not>()))>> \
    friend T* deepeq_refl_determine_base_type(DeepEqRefl_U const&, DeepEqRefl_Not const&) {                                                                                        \
        return nullptr;                                                                                                                                                             \
    }                                                                                                                                                                               \
                                                                                                                                                                                    \
    constexpr auto deepeq_refl_members_as_tuple()& { return std::tie(__VA_ARGS__); }                                                                                                \
                                                                                                                                                                                    \
    constexpr auto deepeq_refl_members_as_tuple() const& { return std::tie(__VA_ARGS__); }                                                                                          \
                                                                                                                                                                                    \
    static constexpr std::integral_constant<std::size_t, DEEPEQ_REFLECT_COUNT_ARGS(__VA_ARGS__)> deepeq_refl_data_member_count{};                                                   \
                                                                                                                                                                                    \
    static constexpr auto deepeq_refl_data_member_names = std::tuple { DEEPEQ_REFLECT_TO_STRINGS(__VA_ARGS__) }

namespace deepeq::refl {

using std::size_t;

namespace detail {

template<typename T, typename U>
struct make_dependent {
    using type = U;
};

template<typename T, typename U>
using make_dependent_t = typename make_dependent<T, U>::type;

template<typename T>
concept class_type = std::is_class_v<T>;

struct None {};

template<typename T, typename Excluding>
using find_base = std::remove_pointer_t<decltype(deepeq_refl_determine_base_type(std::declval<T>(), std::declval<Excluding>()))>;

template<typename T, typename Last = None>
struct base_type_impl {
    using type = void;
};

// if Last is None we're starting the search
template<class_type T>
struct base_type_impl<T, None> {
    using type = typename base_type_impl<T, std::remove_pointer_t<decltype(deepeq_refl_determine_base_type(std::declval<T>(), 0))>>::type;
};

// if Last is void => there's no base type (void)
template<class_type T>
struct base_type_impl<T, void> {
    using type = void;
};

// otherwise, if find_base<T, Last> is void, Last is the base type
template<class_type T, class_type Last>
requires std::derived_from<T, Last> and std::is_void_v<find_base<T, Last>>
struct base_type_impl<T, Last> {
    using type = Last;
};

// otherwise, find_base<T, Last> is the next Last => recurse
template<class_type T, class_type Last>
requires std::derived_from<T, Last> and (not std::is_void_v<find_base<T, Last>>)
struct base_type_impl<T, Last> {
    using type = typename base_type_impl<T, find_base<T, Last>>::type;
};

template<typename T>
constexpr typename base_type_impl<T>::type const& to_base_type(T const& obj) {
    return obj;
}

template<typename T>
constexpr typename base_type_impl<T>::type& to_base_type(T& obj) {
    return obj;
}

} // namespace detail

template<typename T>
concept reflectable = std::is_class_v<std::remove_cvref_t<T>> and requires {
    { std::remove_cvref_t<T>::deepeq_refl_data_member_count } -> std::convertible_to<size_t>;
};

template<typename T>
using base_type = typename detail::base_type_impl<T>::type;

template<typename T>
constexpr size_t data_member_count = 0;

template<reflectable T>
requires std::is_void_v<base_type<T>>
constexpr size_t data_member_count<T> = T::deepeq_refl_data_member_count;

template<reflectable T>
requires(not std::is_void_v<base_type<T>>)
constexpr size_t data_member_count<T> = T::deepeq_refl_data_member_count + data_member_count<base_type<T>>;

template<typename T, size_t Idx>
constexpr auto data_member_name = [] {
    static_assert(Idx < data_member_count<T>);
    return ::deepeq::meta::constexpr_string<"Error">();
}();

template<reflectable T, size_t Idx>
requires(Idx < data_member_count<base_type<T>>)
constexpr auto data_member_name<T, Idx> = data_member_name<base_type<T>, Idx>;

template<reflectable T, size_t Idx>
requires(Idx >= data_member_count<base_type<T>>) and (Idx < data_member_count<T>)
constexpr auto data_member_name<T, Idx> = std::get<Idx - data_member_count<base_type<T>>>(T::deepeq_refl_data_member_names);

template<size_t Idx>
constexpr decltype(auto) data_member(reflectable auto&& obj) {
    using Class    = std::remove_cvref_t<decltype(obj)>;
    using BaseType = base_type<Class>;

    constexpr size_t base_size = data_member_count<BaseType>;

    if constexpr (Idx < base_size) {
        return data_member<Idx>(detail::to_base_type(obj));
    } else {
        return std::get<Idx - base_size>(obj.deepeq_refl_members_as_tuple());
    }
}

/// type of the Idx-th data member (incl. base class members), without cv/ref qualification
template<reflectable T, size_t Idx>
using data_member_type = std::remove_cvref_t<decltype(data_member<Idx>(std::declval<T&>()))>;

} // namespace deepeq::refl

#endif // DEEPEQ_REFLECTION_HPP
