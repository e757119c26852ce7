#include "sections/section.hpp"

#include "common/error_types.hpp"
#include "sections/relocation.hpp"

#include <range/v3/algorithm/find.hpp>

#include <array>
#include <cstddef>
#include <map>
#include <string_view>
#include <utility>

namespace objmodel {

namespace {

struct SectionNameKind
{
    std::string_view name;
    SectionKind kind;
};

constexpr std::array KNOWN_SECTIONS = std::to_array<SectionNameKind>({
    {".init", SectionKind::Code},
    {".text", SectionKind::Code},
    {".dbgtext", SectionKind::Code},
    {".vmtext", SectionKind::Code},
    {".ctors", SectionKind::ReadOnlyData},
    {".dtors", SectionKind::ReadOnlyData},
    {".rodata", SectionKind::ReadOnlyData},
    {".sdata2", SectionKind::ReadOnlyData},
    {"extab", SectionKind::ReadOnlyData},
    {"extabindex", SectionKind::ReadOnlyData},
    {".bss", SectionKind::Bss},
    {".sbss", SectionKind::Bss},
    {".sbss2", SectionKind::Bss},
    {".data", SectionKind::Data},
    {".sdata", SectionKind::Data},
});

/// Shared by both relocation map builders; ``make_value`` produces the mapped value for a relocation
template <typename Value, typename MakeValue>
Result<std::map<Address, Value>> build_relocation_map_impl(const Section& section, MakeValue make_value) {
    std::map<Address, Value> relocations;

    for (std::size_t idx = 0; idx < section.relocations.size(); ++idx) {
        const Relocation& reloc = section.relocations[idx];

        auto [it, inserted] = relocations.try_emplace(reloc.address, make_value(idx, reloc));
        if (!inserted) {
            return make_error(ErrorKind::DuplicateRelocation, "Duplicate relocation @ {:#010X} in section {}",
                              reloc.address, section.name);
        }
    }

    return relocations;
}

} // namespace

Result<SectionKind> section_kind_for_name(std::string_view name) {
    auto it = ranges::find(KNOWN_SECTIONS, name, &SectionNameKind::name);

    if (it == KNOWN_SECTIONS.end()) {
        return make_error(ErrorKind::UnknownSection, "Unknown section {}", name);
    }

    return it->kind;
}

Result<std::map<Address, std::size_t>> Section::build_relocation_map() const {
    return build_relocation_map_impl<std::size_t>(*this, [](std::size_t idx, const Relocation&) { return idx; });
}

Result<std::map<Address, Relocation>> Section::build_relocation_map_cloned() const {
    return build_relocation_map_impl<Relocation>(*this, [](std::size_t, const Relocation& reloc) { return reloc; });
}

} // namespace objmodel
