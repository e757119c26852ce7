#pragma once

#include <objmodel/common/formatters/enum.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace objmodel {

/// Absolute address in the 32-bit target address space
using Address = std::uint32_t;

/// Position of a symbol in a SymbolTable. Never invalidated once handed out
using SymbolIndex = std::size_t;

/// Position of a section in ObjectInfo::sections
using SectionIndex = std::size_t;

/// Prefix of auto-generated label names, eligible for replacement by a real symbol
inline constexpr std::string_view PLACEHOLDER_LABEL_PREFIX = "lbl_";

/// Prefix of compiler-generated jump table labels
inline constexpr std::string_view JUMP_TABLE_LABEL_PREFIX = "..";

enum class SymbolFlag : std::uint8_t { Global, Local, Weak, Common, Hidden, ForceActive };

/// Set of SymbolFlag values. Global and Local are never both set
class SymbolFlagSet
{
public:
    constexpr SymbolFlagSet() = default;

    /// Flags are applied in order, as if by ``set``
    SymbolFlagSet(std::initializer_list<SymbolFlag> flags);

    constexpr bool contains(SymbolFlag flag) const noexcept { return (bits_ & mask(flag)) != 0; }

    constexpr bool is_local() const noexcept { return contains(SymbolFlag::Local); }

    /// Anything that is not explicitly local is visible outside of its unit
    constexpr bool is_global() const noexcept { return !is_local(); }

    constexpr bool is_weak() const noexcept { return contains(SymbolFlag::Weak); }

    constexpr bool is_common() const noexcept { return contains(SymbolFlag::Common); }

    constexpr bool is_hidden() const noexcept { return contains(SymbolFlag::Hidden); }

    constexpr bool is_force_active() const noexcept { return contains(SymbolFlag::ForceActive); }

    /// Sets Global, clearing Local and Weak
    void set_global() noexcept;

    /// Sets Local, clearing Global
    void set_local() noexcept;

    void set(SymbolFlag flag) noexcept;

    void clear(SymbolFlag flag) noexcept;

    constexpr std::uint8_t bits() const noexcept { return bits_; }

    constexpr bool operator==(const SymbolFlagSet& rhs) const = default;

private:
    static constexpr std::uint8_t mask(SymbolFlag flag) noexcept {
        return static_cast<std::uint8_t>(1U << static_cast<std::uint8_t>(flag));
    }

    std::uint8_t bits_{};
};

enum class SymbolKind { Unknown, Function, Object, Section };

/// Interpretation of the bytes of an Object symbol
enum class DataKind { Unknown, Byte, Byte2, Byte4, Byte8, Float, Double, String, String16, StringTable, String16Table };

struct Symbol
{
    std::string name;
    std::optional<std::string> demangled_name;
    Address address{};
    /// Unset for absolute (sectionless) symbols
    std::optional<SectionIndex> section;
    std::uint32_t size{};
    /// Distinguishes a genuine size of 0 from a size that was never observed
    bool size_known{};
    SymbolFlagSet flags;
    SymbolKind kind = SymbolKind::Unknown;
    std::optional<std::uint32_t> align;
    DataKind data_kind = DataKind::Unknown;

    bool operator==(const Symbol& rhs) const = default;
};

constexpr std::string_view enum_name(SymbolFlag flag) {
    switch (flag) {
    case SymbolFlag::Global:
        return "Global";
    case SymbolFlag::Local:
        return "Local";
    case SymbolFlag::Weak:
        return "Weak";
    case SymbolFlag::Common:
        return "Common";
    case SymbolFlag::Hidden:
        return "Hidden";
    case SymbolFlag::ForceActive:
        return "ForceActive";
    }
    return "<unknown>";
}

constexpr std::string_view enum_name(SymbolKind kind) {
    switch (kind) {
    case SymbolKind::Unknown:
        return "Unknown";
    case SymbolKind::Function:
        return "Function";
    case SymbolKind::Object:
        return "Object";
    case SymbolKind::Section:
        return "Section";
    }
    return "<unknown>";
}

constexpr std::string_view enum_name(DataKind kind) {
    switch (kind) {
    case DataKind::Unknown:
        return "Unknown";
    case DataKind::Byte:
        return "Byte";
    case DataKind::Byte2:
        return "Byte2";
    case DataKind::Byte4:
        return "Byte4";
    case DataKind::Byte8:
        return "Byte8";
    case DataKind::Float:
        return "Float";
    case DataKind::Double:
        return "Double";
    case DataKind::String:
        return "String";
    case DataKind::String16:
        return "String16";
    case DataKind::StringTable:
        return "StringTable";
    case DataKind::String16Table:
        return "String16Table";
    }
    return "<unknown>";
}

} // namespace objmodel

FMT_SERIALIZE_ENUM(::objmodel::SymbolFlag);
FMT_SERIALIZE_ENUM(::objmodel::SymbolKind);
FMT_SERIALIZE_ENUM(::objmodel::DataKind);

template <>
struct fmt::formatter<::objmodel::SymbolFlagSet> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const ::objmodel::SymbolFlagSet& from, Context& ctx) const {
        using ::objmodel::SymbolFlag;

        auto out = fmt::format_to(ctx.out(), "{{");
        bool first = true;
        for (auto flag : {SymbolFlag::Global, SymbolFlag::Local, SymbolFlag::Weak, SymbolFlag::Common,
                          SymbolFlag::Hidden, SymbolFlag::ForceActive}) {
            if (from.contains(flag)) {
                out = fmt::format_to(out, "{}{}", first ? "" : "|", flag);
                first = false;
            }
        }
        return fmt::format_to(out, "}}");
    }
};

template <>
struct fmt::formatter<::objmodel::Symbol> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const ::objmodel::Symbol& from, Context& ctx) const {
        const std::string section_str = from.section ? fmt::format("{}", *from.section) : "ABS";
        const std::string size_str = from.size_known ? fmt::format("{:#X}", from.size) : "?";

        return fmt::format_to(ctx.out(),
                              "Symbol{{.name={:?}, .address={:#010X}, .section={}, .size={}, .kind={}, .flags={}}}",
                              from.name, from.address, section_str, size_str, from.kind, from.flags);
    }
};
