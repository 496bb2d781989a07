#include <deepeq/meta/utils.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

std::string_view trimmed(std::string_view view) {
    while (!view.empty() && view.front() == ' ') {
        view.remove_prefix(1);
    }
    while (!view.empty() && view.back() == ' ') {
        view.remove_suffix(1);
    }
    return view;
}

// removes implementation-reserved inline namespaces such as 'std::__cxx11' or 'std::__1'
std::string stripStdPrivates(std::string_view name) {
    static const std::regex stdPrivate("::_[A-Z_][^:]*");
    return std::regex_replace(std::string(name), stdPrivate, std::string());
}

// splits 'a, b<c, d>, e' on top-level commas only
std::vector<std::string_view> splitTemplateArguments(std::string_view arguments) {
    std::vector<std::string_view> result;
    std::size_t                   depth = 0UZ;
    std::size_t                   begin = 0UZ;
    for (std::size_t cursor = 0UZ; cursor < arguments.size(); ++cursor) {
        switch (arguments[cursor]) {
        case '<': ++depth; break;
        case '>': --depth; break;
        case ',':
            if (depth == 0UZ) {
                result.push_back(trimmed(arguments.substr(begin, cursor - begin)));
                begin = cursor + 1UZ;
            }
            break;
        default: break;
        }
    }
    result.push_back(trimmed(arguments.substr(begin)));
    return result;
}

} // namespace

std::string deepeq::meta::detail::makePortableTypeName(std::string_view name) {
    using namespace std::string_literals;
    using deepeq::meta::detail::local_type_name;
    static const auto typeMapping = std::array<std::pair<std::string, std::string>, 14>{{
        {local_type_name<std::int8_t>(), "int8"s}, {local_type_name<std::int16_t>(), "int16"s}, {local_type_name<std::int32_t>(), "int32"s}, {local_type_name<std::int64_t>(), "int64"s},         //
        {local_type_name<std::uint8_t>(), "uint8"s}, {local_type_name<std::uint16_t>(), "uint16"s}, {local_type_name<std::uint32_t>(), "uint32"s}, {local_type_name<std::uint64_t>(), "uint64"s}, //
        {local_type_name<float>(), "float32"s}, {local_type_name<double>(), "float64"s}, {local_type_name<bool>(), "bool"s},                                                                      //
        {local_type_name<std::string>(), "string"s}, {local_type_name<std::string_view>(), "string_view"s}, {local_type_name<char>(), "char"s},                                                   //
    }};

    if (const auto it = std::ranges::find_if(typeMapping, [&](const auto& pair) { return pair.first == name; }); it != typeMapping.end()) {
        return it->second;
    }

    const auto open = name.find('<');
    if (open == std::string_view::npos || !name.ends_with('>')) {
        return stripStdPrivates(name);
    }

    std::vector<std::string> arguments;
    for (std::string_view argument : splitTemplateArguments(name.substr(open + 1UZ, name.size() - open - 2UZ))) {
        arguments.push_back(makePortableTypeName(argument));
    }
    return fmt::format("{}<{}>", stripStdPrivates(name.substr(0UZ, open)), fmt::join(arguments, ", "));
}
