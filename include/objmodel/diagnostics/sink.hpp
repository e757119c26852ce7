#pragma once

#include <objmodel/common/formatters/enum.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace objmodel {

enum class DiagnosticKind {
    SizeConflict, ///< Two passes observed different known sizes for one symbol
};

constexpr std::string_view enum_name(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::SizeConflict:
        return "SizeConflict";
    }
    return "<unknown>";
}

/// A non-fatal finding reported while mutating the object model
struct Diagnostic
{
    DiagnosticKind kind = DiagnosticKind::SizeConflict;
    std::string symbol_name;
    std::uint32_t address{};
    std::uint32_t old_size{};
    std::uint32_t new_size{};
    std::string message;
};

/// Receiver for soft conflicts. Injected into a SymbolTable / ObjectInfo
class DiagnosticSink
{
public:
    virtual void report(const Diagnostic& diagnostic) = 0;

    virtual ~DiagnosticSink() = default;
};

} // namespace objmodel

FMT_SERIALIZE_ENUM(::objmodel::DiagnosticKind);

template <>
struct fmt::formatter<::objmodel::Diagnostic> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const ::objmodel::Diagnostic& from, Context& ctx) const {
        return fmt::format_to(ctx.out(), "[{}] {}", from.kind, from.message);
    }
};
