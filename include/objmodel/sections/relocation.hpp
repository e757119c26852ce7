#pragma once

#include <objmodel/common/formatters/enum.hpp>
#include <objmodel/symbols/symbol.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <string_view>

namespace objmodel {

/// PowerPC addressing modes that a relocation can patch
enum class RelocationKind {
    Absolute,            ///< Full 32-bit address
    AddrHi,              ///< @h - upper 16 bits
    AddrHa,              ///< @ha - upper 16 bits, adjusted for the sign of the lower half
    AddrLo,              ///< @l - lower 16 bits
    Rel24,               ///< Branch displacement (b, bl)
    Rel14,               ///< Conditional branch displacement (bc)
    EmbeddedSmallData21, ///< EABI small data area access
};

constexpr std::string_view enum_name(RelocationKind kind) {
    switch (kind) {
    case RelocationKind::Absolute:
        return "Absolute";
    case RelocationKind::AddrHi:
        return "AddrHi";
    case RelocationKind::AddrHa:
        return "AddrHa";
    case RelocationKind::AddrLo:
        return "AddrLo";
    case RelocationKind::Rel24:
        return "Rel24";
    case RelocationKind::Rel14:
        return "Rel14";
    case RelocationKind::EmbeddedSmallData21:
        return "EmbeddedSmallData21";
    }
    return "<unknown>";
}

/// True for the modes that compute half of an address (lis/addi style pairs)
constexpr bool is_half_address(RelocationKind kind) noexcept {
    switch (kind) {
    case RelocationKind::AddrHi:
    case RelocationKind::AddrHa:
    case RelocationKind::AddrLo:
        return true;
    case RelocationKind::Absolute:
    case RelocationKind::Rel24:
    case RelocationKind::Rel14:
    case RelocationKind::EmbeddedSmallData21:
        return false;
    }
    return false;
}

struct Relocation
{
    RelocationKind kind = RelocationKind::Absolute;
    /// Address within the owning section that is patched
    Address address{};
    SymbolIndex target_symbol{};
    std::int64_t addend{};

    bool operator==(const Relocation& rhs) const = default;
};

/// Relocation of a relocatable module against a section of another module,
/// kept until that module is linked in
struct ModuleRelocation
{
    RelocationKind kind = RelocationKind::Absolute;
    SectionIndex section{};
    Address address{};
    std::uint32_t module_id{};
    SectionIndex target_section{};
    std::uint32_t addend{};

    bool operator==(const ModuleRelocation& rhs) const = default;
};

} // namespace objmodel

FMT_SERIALIZE_ENUM(::objmodel::RelocationKind);

template <>
struct fmt::formatter<::objmodel::Relocation> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const ::objmodel::Relocation& from, Context& ctx) const {
        return fmt::format_to(ctx.out(), "Relocation{{.kind={}, .address={:#010X}, .target={}, .addend={:#X}}}",
                              from.kind, from.address, from.target_symbol, from.addend);
    }
};

template <>
struct fmt::formatter<::objmodel::ModuleRelocation> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const ::objmodel::ModuleRelocation& from, Context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "ModuleRelocation{{.kind={}, .section={}, .address={:#010X}, .module={}, "
                              ".target_section={}, .addend={:#X}}}",
                              from.kind, from.section, from.address, from.module_id, from.target_section,
                              from.addend);
    }
};
