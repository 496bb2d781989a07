#ifndef DEEPEQ_META_UTILS_HPP
#define DEEPEQ_META_UTILS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cxxabi.h>
#include <functional>
#include <iostream>
#include <compare>
#include <concepts>
#include <map>
#include <memory>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace deepeq::meta {

[[gnu::always_inline]] constexpr void precondition(bool cond, const std::source_location loc = std::source_location::current()) {
    if consteval {
        if (not cond) {
            std::unreachable();
        }
    } else {
        struct handle {
            [[noreturn]] static void failure(std::source_location const& location) {
                std::clog << "failed precondition in " << location.file_name() << ':' << location.line() << ':' << location.column() << ": `" << location.function_name() << "`\n";
                __builtin_trap();
            }
        };

        if (not cond) [[unlikely]] {
            handle::failure(loc);
        }
    }
}

template<std::size_t N, typename CharT = char>
struct fixed_string {
    CharT _data[N + 1UZ] = {};

    // types
    using value_type      = CharT;
    using pointer         = value_type*;
    using const_pointer   = const value_type*;
    using reference       = value_type&;
    using const_reference = const value_type&;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    // construction and assignment
    explicit fixed_string() = default;

    template<std::convertible_to<CharT>... Chars>
    requires(sizeof...(Chars) == N) and (... and not std::is_pointer_v<Chars>)
    constexpr explicit fixed_string(Chars... chars) noexcept //
        : _data{static_cast<CharT>(chars)..., '\0'} {}

    template<std::size_t... Is>
    requires(sizeof...(Is) == N)
    constexpr fixed_string(std::index_sequence<Is...>, const CharT* txt) noexcept //
        : _data{txt[Is]..., '\0'} {}

    consteval fixed_string(const CharT (&txt)[N + 1]) noexcept //
        : fixed_string(std::make_index_sequence<N>(), txt) {}

    constexpr fixed_string(const fixed_string&) noexcept = default;

    constexpr fixed_string& operator=(const fixed_string&) noexcept = default;

    // capacity
    static constexpr std::integral_constant<size_type, N> size{};

    static constexpr std::integral_constant<size_type, N> length{};

    [[nodiscard]] static constexpr bool empty() noexcept { return N == 0; }

    // element access
    [[nodiscard]] constexpr reference operator[](size_type pos) { return _data[pos]; }

    [[nodiscard]] constexpr const_reference operator[](size_type pos) const { return _data[pos]; }

    // string operations
    [[nodiscard]] constexpr const_pointer c_str() const noexcept { return _data; }

    [[nodiscard]] constexpr const_pointer data() const noexcept { return _data; }

    [[nodiscard]] constexpr std::string_view view() const noexcept { return {_data, N}; }

    constexpr operator std::string_view() const noexcept { return {_data, N}; }

    [[nodiscard]] explicit operator std::string() const noexcept { return {_data, N}; }

    [[nodiscard]] friend constexpr bool operator==(const fixed_string& lhs, const fixed_string& rhs) { //
        return lhs.view() == rhs.view();
    }

    [[nodiscard]] friend constexpr auto operator<=>(const fixed_string& lhs, const fixed_string& rhs) { //
        return lhs.view() <=> rhs.view();
    }
};

template<fixed_string S, typename T = std::remove_const_t<decltype(S)>>
class constexpr_string;

// fixed_string deduction guides
template<typename CharT, std::convertible_to<CharT>... Rest>
fixed_string(CharT, Rest...) -> fixed_string<1 + sizeof...(Rest), CharT>;

template<typename CharT, std::size_t N>
fixed_string(const CharT (&str)[N]) -> fixed_string<N - 1, CharT>;

/**
 * Store a compile-time string as a type, rather than a value. This enables:
 *
 * 1. Passing strings as function parameters and using them in constant expressions in the function body.
 *
 * 2. Conversion to C-String and std::string_view can return a never-dangling pointer to .rodata.
 */
template<fixed_string S, typename T> // The T parameter exists solely for enabling lookup of fixed_string operators (ADL).
class constexpr_string {
public:
    static constexpr auto value = S;

    constexpr operator T() const { return value; }

    // types
    using value_type      = typename T::value_type;
    using const_pointer   = const value_type*;
    using const_reference = const value_type&;
    using size_type       = std::size_t;

    // capacity
    static constexpr auto size = S.size;

    [[nodiscard]] static constexpr bool empty() noexcept { return S.empty(); }

    // element access
    [[nodiscard]] consteval const_reference operator[](size_type pos) const { return S[pos]; }

    // string operations
    [[nodiscard]] consteval const_pointer c_str() const noexcept { return S.c_str(); }

    [[nodiscard]] consteval const_pointer data() const noexcept { return S.data(); }

    [[nodiscard]] consteval std::string_view view() const noexcept { return S.view(); }

    consteval operator std::string_view() const noexcept { return S.view(); }

};

namespace detail {
template<std::integral auto N>
consteval auto fixed_string_from_number_impl() {
    constexpr std::size_t buf_len = [] {
        auto        x   = N;
        std::size_t len = x < 0 ? 1u : 0u; // minus character
        while (x != 0) {                   // count digits
            ++len;
            x /= 10;
        }
        return len;
    }();
    fixed_string<buf_len> ret{};

    constexpr bool negative = N < 0;

    // do *not* do abs(N) here to support INT_MIN
    auto        x = N;
    std::size_t i = buf_len;
    while (x != 0) {
        ret[--i] = static_cast<char>('0' + (negative ? -1 : 1) * static_cast<int>(x % 10));
        x /= 10;
    }
    if (negative) {
        ret[--i] = '-';
    }
    return ret;
}

template<typename T>
[[nodiscard]] std::string local_type_name() noexcept {
    std::string type_name = typeid(T).name();
    int         status;
    char*       demangled_name = abi::__cxa_demangle(type_name.c_str(), nullptr, nullptr, &status);
    if (status == 0) {
        std::string ret(demangled_name);
        std::free(demangled_name);
        return ret;
    } else {
        std::free(demangled_name);
        return typeid(T).name();
    }
}

std::string makePortableTypeName(std::string_view name);

} // namespace detail

template<std::integral auto N>
inline constexpr auto fixed_string_from_number = detail::fixed_string_from_number_impl<N>();

template<std::integral auto N>
requires(N >= 0 and N < 10)
inline constexpr auto fixed_string_from_number<N> = fixed_string<1>('0' + N);

static_assert(fixed_string("0") == fixed_string_from_number<0>);
static_assert(fixed_string("7") == fixed_string_from_number<7>);
static_assert(fixed_string("-1") == fixed_string_from_number<-1>);
static_assert(fixed_string("123") == fixed_string_from_number<123>);

/// portable, demangled type name, e.g. 'int32', 'float64', 'string', 'std::vector<int32, std::allocator<int32>>'
template<typename T>
[[nodiscard]] std::string type_name() noexcept {
    return detail::makePortableTypeName(detail::local_type_name<T>());
}

template<template<typename...> class Template, typename Class>
struct is_instantiation : std::false_type {};

template<template<typename...> class Template, typename... Args>
struct is_instantiation<Template, Template<Args...>> : std::true_type {};

template<typename Class, template<typename...> class Template>
concept is_instantiation_of = is_instantiation<Template, Class>::value;

template<typename T>
concept map_type = is_instantiation_of<T, std::map> || is_instantiation_of<T, std::unordered_map>;

template<typename T>
concept vector_type = is_instantiation_of<std::remove_cv_t<T>, std::vector>;

template<typename T>
struct is_std_array_type : std::false_type {};

template<typename T, std::size_t N>
struct is_std_array_type<std::array<T, N>> : std::true_type {};

template<typename T>
concept array_type = is_std_array_type<std::remove_cv_t<T>>::value;

template<typename T>
struct is_dynamic_span_type : std::false_type {};

template<typename T>
struct is_dynamic_span_type<std::span<T, std::dynamic_extent>> : std::true_type {};

template<typename T>
concept dynamic_span_type = is_dynamic_span_type<std::remove_cv_t<T>>::value;

template<typename T>
struct is_static_span_type : std::false_type {};

template<typename T, std::size_t N>
requires(N != std::dynamic_extent)
struct is_static_span_type<std::span<T, N>> : std::true_type {};

template<typename T>
concept static_span_type = is_static_span_type<std::remove_cv_t<T>>::value;

template<typename T>
concept reference_wrapper_type = is_instantiation_of<std::remove_cv_t<T>, std::reference_wrapper>;

template<typename T>
concept smart_pointer_type = is_instantiation_of<T, std::shared_ptr> || is_instantiation_of<T, std::unique_ptr>;

template<typename T>
concept pair_or_tuple_type = is_instantiation_of<T, std::pair> || is_instantiation_of<T, std::tuple>;

} // namespace deepeq::meta

#endif // DEEPEQ_META_UTILS_HPP
