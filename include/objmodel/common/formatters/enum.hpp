#pragma once

#include <objmodel/common/formatters/debug.hpp>

#include <fmt/format.h>

#include <string_view>
#include <type_traits>

namespace objmodel::detail {

/// Formats any enum that has an ``enum_name`` overload visible by ADL.
///
/// "{}"   -> "Function"
/// "{:?}" -> "Function (1)"
template <typename Enum>
    requires std::is_enum_v<Enum>
struct EnumFormatter : DebugFormatter
{
    auto format(const Enum& from, fmt::format_context& ctx) const {
        const std::string_view name = enum_name(from);

        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "{} ({})", name, fmt::underlying(from));
        }

        return fmt::format_to(ctx.out(), "{}", name);
    }
};

} // namespace objmodel::detail

/// Declare a fmt::formatter for an enum with an ``enum_name`` overload
#define FMT_SERIALIZE_ENUM(enum_type)                                                                                  \
    template <>                                                                                                        \
    struct fmt::formatter<enum_type> : ::objmodel::detail::EnumFormatter<enum_type>                                    \
    {                                                                                                                  \
    }
