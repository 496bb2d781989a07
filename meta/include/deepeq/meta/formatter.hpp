#ifndef DEEPEQ_FORMATTER_HPP
#define DEEPEQ_FORMATTER_HPP

#include <chrono>
#include <concepts>
#include <cstdint>
#include <exception>
#include <expected>
#include <format>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>

#ifdef __GNUC__
#pragma GCC diagnostic push // ignore warning of external libraries that from this lib-context we do not have any control over
#ifndef __clang__
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif
#include <magic_enum.hpp>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

namespace deepeq {
namespace time {
[[nodiscard]] inline std::string getIsoTime(std::chrono::system_clock::time_point timePoint = std::chrono::system_clock::now()) noexcept {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(timePoint);
    const auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(timePoint - secs).count();
    return std::format("{:%Y-%m-%dT%H:%M:%S}.{:03}", secs, ms); // ms-precision ISO time-format
}
} // namespace time

template<std::ranges::input_range R>
requires std::formattable<std::ranges::range_value_t<R>, char>
std::string join(const R& range, std::string_view sep = ", ") {
    std::string out;
    auto        it  = std::ranges::begin(range);
    const auto  end = std::ranges::end(range);
    if (it != end) {
        out += std::format("{}", *it);
        while (++it != end) {
            out += std::format("{}{}", sep, *it);
        }
    }
    return out;
}

template<typename T>
constexpr auto ptr(const T* p) {
    return std::format("{:#x}", reinterpret_cast<std::uintptr_t>(p));
}
} // namespace deepeq

template<>
struct std::formatter<std::source_location, char> {
    char presentation = 's';

    constexpr auto parse(std::format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 's' || *it == 'f' || *it == 't')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw std::format_error("invalid format specifier for source_location");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const std::source_location& loc, FormatContext& ctx) const {
        switch (presentation) {
        case 's': return std::format_to(ctx.out(), "{}", loc.file_name());
        case 't': return std::format_to(ctx.out(), "{}:{}", loc.file_name(), loc.line());
        case 'f':
        default: return std::format_to(ctx.out(), "{}:{} in {}", loc.file_name(), loc.line(), loc.function_name());
        }
    }
};

template<typename Value, typename Error>
struct std::formatter<std::expected<Value, Error>> {
    constexpr auto parse(format_parse_context& ctx) const noexcept -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const std::expected<Value, Error>& ret, FormatContext& ctx) const -> decltype(ctx.out()) {
        if (ret.has_value()) {
            return std::format_to(ctx.out(), "<std::expected-value: {}>", ret.value());
        } else {
            return std::format_to(ctx.out(), "<std::unexpected: {}>", ret.error());
        }
    }
};

template<typename T>
requires std::derived_from<T, std::exception>
struct std::formatter<T, char> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const T& e, FormatContext& ctx) const {
        return std::format_to(ctx.out(), "{}", e.what());
    }
};

template<typename E>
requires std::is_enum_v<E>
struct std::formatter<E, char> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(E e, FormatContext& ctx) const {
        if (auto name = magic_enum::enum_name(e); !name.empty()) {
            return std::format_to(ctx.out(), "{}", name);
        } else {
            return std::format_to(ctx.out(), "{}", static_cast<std::underlying_type_t<E>>(e));
        }
    }
};

#endif // DEEPEQ_FORMATTER_HPP
