#ifndef DEEPEQ_TYPE_DESCRIPTOR_FORMATTER_HPP
#define DEEPEQ_TYPE_DESCRIPTOR_FORMATTER_HPP

#include <deepeq/TypeDescriptor.hpp>
#include <deepeq/meta/formatter.hpp>

#include <format>

template<>
struct std::formatter<deepeq::TypeDescriptor, char> {
    constexpr auto parse(std::format_parse_context& ctx) const noexcept -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const deepeq::TypeDescriptor& type, FormatContext& ctx) const {
        return std::format_to(ctx.out(), "{} [{}]", type.name, type.kind);
    }
};

// 'p' additionally prints the address, e.g. 'int32 [Primitive] @0x7ffc...'
template<>
struct std::formatter<deepeq::ValueRef, char> {
    bool withAddress = false;

    constexpr auto parse(std::format_parse_context& ctx) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it == 'p') {
            withAddress = true;
            ++it;
        }
        if (it != ctx.end() && *it != '}') {
            throw std::format_error("invalid format specifier for deepeq::ValueRef");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const deepeq::ValueRef& value, FormatContext& ctx) const {
        if (!value.valid()) {
            return std::format_to(ctx.out(), "<no value>");
        }
        if (withAddress) {
            return std::format_to(ctx.out(), "{} @{}", value.type(), deepeq::ptr(value.address()));
        }
        return std::format_to(ctx.out(), "{}", value.type());
    }
};

#endif // DEEPEQ_TYPE_DESCRIPTOR_FORMATTER_HPP
