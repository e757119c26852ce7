#pragma once

#include <objmodel/common/error_types.hpp>
#include <objmodel/common/formatters/enum.hpp>
#include <objmodel/sections/relocation.hpp>
#include <objmodel/symbols/symbol.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace objmodel {

enum class SectionKind { Code, Data, ReadOnlyData, Bss };

constexpr std::string_view enum_name(SectionKind kind) {
    switch (kind) {
    case SectionKind::Code:
        return "Code";
    case SectionKind::Data:
        return "Data";
    case SectionKind::ReadOnlyData:
        return "ReadOnlyData";
    case SectionKind::Bss:
        return "Bss";
    }
    return "<unknown>";
}

/// Classify a section by its name in the input file.
/// Names outside of the known set are an error rather than a guess.
Result<SectionKind> section_kind_for_name(std::string_view name);

struct Section
{
    std::string name;
    SectionKind kind = SectionKind::Code;
    Address address{};
    std::uint32_t size{};
    /// Empty for Bss
    std::vector<std::uint8_t> data;
    std::uint32_t align{};
    SectionIndex index{};
    /// Index in the input file; relocatable modules refer to sections by this
    std::size_t elf_index{};
    std::vector<Relocation> relocations;
    /// Address before this object's addressing was finalized
    Address original_address{};
    std::uint64_t file_offset{};
    /// Whether ``kind`` is known, or only a best guess
    bool section_known{};

    /// Relocation address -> position in ``relocations``
    Result<std::map<Address, std::size_t>> build_relocation_map() const;

    /// Relocation address -> relocation
    Result<std::map<Address, Relocation>> build_relocation_map_cloned() const;

    /// One past the last address of the section
    std::uint64_t end() const noexcept { return std::uint64_t{address} + size; }

    /// Half-open: ``address + size`` is outside of the section
    bool contains(Address addr) const noexcept { return addr >= address && addr < end(); }

    /// Whether [start, end) lies entirely within the section
    bool contains_range(Address start, Address end_addr) const noexcept {
        return start >= address && end_addr <= end();
    }
};

} // namespace objmodel

FMT_SERIALIZE_ENUM(::objmodel::SectionKind);

template <>
struct fmt::formatter<::objmodel::Section> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const ::objmodel::Section& from, Context& ctx) const {
        return fmt::format_to(ctx.out(), "Section{{.name={:?}, .kind={}, .address={:#010X}, .size={:#X}, .index={}}}",
                              from.name, from.kind, from.address, from.size, from.index);
    }
};
