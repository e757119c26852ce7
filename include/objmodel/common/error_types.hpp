#pragma once

#include <objmodel/common/expected.hpp>
#include <objmodel/common/formatters/enum.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>

namespace objmodel {

// NOLINTNEXTLINE
enum class ErrorKind {
    AmbiguousSymbol,     ///< A query expecting a unique symbol found several candidates
    DuplicateRelocation, ///< Two relocations in one section share an address
    SectionNotFound,     ///< No section covers an address or address range
    OverlappingSections, ///< More than one section covers an address or address range
    AddressImmutable,    ///< Attempted to move a symbol to a different address
    UnknownSection,      ///< A section name outside of the known set of section names
};

constexpr std::string_view enum_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::AmbiguousSymbol:
        return "AmbiguousSymbol";
    case ErrorKind::DuplicateRelocation:
        return "DuplicateRelocation";
    case ErrorKind::SectionNotFound:
        return "SectionNotFound";
    case ErrorKind::OverlappingSections:
        return "OverlappingSections";
    case ErrorKind::AddressImmutable:
        return "AddressImmutable";
    case ErrorKind::UnknownSection:
        return "UnknownSection";
    }
    return "<unknown>";
}

struct Error
{
    ErrorKind kind;
    std::string message;

    bool operator==(const Error& rhs) const = default;
};

template <typename... Args>
Error make_error(ErrorKind kind, fmt::format_string<Args...> fmt_str, Args&&... args) {
    return Error{kind, fmt::format(fmt_str, std::forward<Args>(args)...)};
}

template <typename T>
using Result = Expected<T, Error>;

} // namespace objmodel

FMT_SERIALIZE_ENUM(::objmodel::ErrorKind);

template <>
struct fmt::formatter<::objmodel::Error> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const ::objmodel::Error& from, Context& ctx) const {
        return fmt::format_to(ctx.out(), "{}: {}", from.kind, from.message);
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
