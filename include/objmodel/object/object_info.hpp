/// \file
/// The object model: everything known about one executable or relocatable module
#pragma once

#include <objmodel/common/error_types.hpp>
#include <objmodel/common/formatters/enum.hpp>
#include <objmodel/diagnostics/sink.hpp>
#include <objmodel/object/split_map.hpp>
#include <objmodel/sections/relocation.hpp>
#include <objmodel/sections/section.hpp>
#include <objmodel/symbols/symbol.hpp>
#include <objmodel/symbols/symbol_table.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace objmodel {

enum class ObjectKind {
    Executable,  ///< Fully linked
    Relocatable, ///< Addresses are fixed up when loaded
};

enum class Architecture { PowerPc };

constexpr std::string_view enum_name(ObjectKind kind) {
    switch (kind) {
    case ObjectKind::Executable:
        return "Executable";
    case ObjectKind::Relocatable:
        return "Relocatable";
    }
    return "<unknown>";
}

constexpr std::string_view enum_name(Architecture arch) {
    switch (arch) {
    case Architecture::PowerPc:
        return "PowerPc";
    }
    return "<unknown>";
}

/// Addresses the linker generates symbols for. Filled in as the symbols are added
struct LinkerAddresses
{
    std::optional<Address> sda2_base;
    std::optional<Address> sda_base;
    std::optional<Address> stack_address;
    std::optional<Address> stack_end;
    std::optional<Address> db_stack_address;
    std::optional<Address> arena_lo;
    std::optional<Address> arena_hi;

    bool operator==(const LinkerAddresses& rhs) const = default;
};

/// Compiler metadata block (.comment), kept as-is
struct CompilerMetadata
{
    std::vector<std::uint8_t> raw;
};

/// A section and a slice of its bytes
struct SectionData
{
    const Section* section = nullptr;
    std::span<const std::uint8_t> bytes;
};

struct ObjectInfo
{
    ObjectInfo(ObjectKind obj_kind, Architecture arch, std::string obj_name, std::vector<Symbol> obj_symbols,
               std::vector<Section> obj_sections);

    ObjectKind kind;
    Architecture architecture;
    std::string name;
    SymbolTable symbols;
    std::vector<Section> sections;
    Address entry{};
    CompilerMetadata compiler_metadata;

    // Linker generated
    LinkerAddresses linker_addresses;

    // Extracted
    SplitMap splits;
    std::map<Address, std::string> named_sections;
    std::vector<std::string> link_order;
    /// start -> end (exclusive)
    std::map<Address, Address> blocked_ranges;

    /// From extab: function start -> size
    std::map<Address, std::uint32_t> known_functions;

    // Relocatable modules
    /// 0 for the main executable
    std::uint32_t module_id{};
    std::vector<ModuleRelocation> unresolved_relocations;

    /// Add a symbol to the table, recording the address of linker generated symbols.
    /// See SymbolTable::add
    Result<SymbolIndex> add_symbol(Symbol in_symbol, bool merge);

    /// The section containing ``address``
    Result<const Section*> section_at(Address address) const;

    /// The section containing [start, end)
    Result<const Section*> section_for(Address start, Address end) const;

    /// Bytes of [start, end) from the section containing ``start``.
    /// ``end == 0`` reads to the end of the section.
    /// The slice is clamped to the bytes the section actually has.
    Result<SectionData> section_data(Address start, Address end) const;

    /// See SplitMap::split_for
    std::optional<SplitRef> split_for(Address address) const { return splits.split_for(address); }

    /// See SplitMap::for_range
    auto splits_for_range(Address start, Address end) const { return splits.for_range(start, end); }

    /// See SplitMap::for_range_inclusive
    auto splits_for_range_inclusive(Address start, Address last) const {
        return splits.for_range_inclusive(start, last);
    }

    void add_split(Address address, Split split);

    /// Whether ``address`` lies within a blocked range
    bool is_blocked(Address address) const;

    void set_diagnostic_sink(DiagnosticSink& sink) noexcept { symbols.set_diagnostic_sink(sink); }
};

} // namespace objmodel

FMT_SERIALIZE_ENUM(::objmodel::ObjectKind);
FMT_SERIALIZE_ENUM(::objmodel::Architecture);
