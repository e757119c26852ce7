#include "object/object_info.hpp"

#include "common/error_types.hpp"
#include "logging.hpp"
#include "sections/section.hpp"
#include "symbols/symbol.hpp"
#include "symbols/symbol_table.hpp"

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/find_if.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace objmodel {

namespace {

struct LinkerSymbol
{
    std::string_view name;
    std::optional<Address> LinkerAddresses::*field;
};

constexpr std::array LINKER_SYMBOLS = std::to_array<LinkerSymbol>({
    {"_SDA_BASE_", &LinkerAddresses::sda_base},
    {"_SDA2_BASE_", &LinkerAddresses::sda2_base},
    {"_stack_addr", &LinkerAddresses::stack_address},
    {"_stack_end", &LinkerAddresses::stack_end},
    {"_db_stack_addr", &LinkerAddresses::db_stack_address},
    {"__ArenaLo", &LinkerAddresses::arena_lo},
    {"__ArenaHi", &LinkerAddresses::arena_hi},
});

/// Finds the one section satisfying ``pred``; ``describe`` names what was looked up for the error message
template <typename Pred>
Result<const Section*> unique_section(const std::vector<Section>& sections, Pred pred, const std::string& describe) {
    const Section* found = nullptr;

    for (const auto& section : sections) {
        if (!pred(section)) {
            continue;
        }

        if (found != nullptr) {
            return make_error(ErrorKind::OverlappingSections, "Sections {} and {} both contain {}", found->name,
                              section.name, describe);
        }
        found = &section;
    }

    if (found == nullptr) {
        return make_error(ErrorKind::SectionNotFound, "Failed to locate section @ {}", describe);
    }

    return found;
}

} // namespace

ObjectInfo::ObjectInfo(ObjectKind obj_kind, Architecture arch, std::string obj_name, std::vector<Symbol> obj_symbols,
                       std::vector<Section> obj_sections)
    : kind{obj_kind}
    , architecture{arch}
    , name{std::move(obj_name)}
    , symbols{std::move(obj_symbols)}
    , sections{std::move(obj_sections)} {}

Result<SymbolIndex> ObjectInfo::add_symbol(Symbol in_symbol, bool merge) {
    auto it = ranges::find_if(LINKER_SYMBOLS, [&in_symbol](const LinkerSymbol& linker_symbol) {
        return linker_symbol.name == in_symbol.name;
    });

    if (it != LINKER_SYMBOLS.end()) {
        LOG_DEBUG("Linker symbol {} @ {:#010X}", in_symbol.name, in_symbol.address);
        linker_addresses.*(it->field) = in_symbol.address;
    }

    return symbols.add(std::move(in_symbol), merge);
}

Result<const Section*> ObjectInfo::section_at(Address address) const {
    return unique_section(
        sections, [address](const Section& section) { return section.contains(address); },
        fmt::format("{:#010X}", address));
}

Result<const Section*> ObjectInfo::section_for(Address start, Address end) const {
    return unique_section(
        sections, [start, end](const Section& section) { return section.contains_range(start, end); },
        fmt::format("{:#010X}-{:#010X}", start, end));
}

Result<SectionData> ObjectInfo::section_data(Address start, Address end) const {
    const Section* section = TRY(section_at(start));

    const std::span<const std::uint8_t> data{section->data};

    // Bss has no bytes, and a section's data may be shorter than its size
    const auto begin_offset = std::min(gsl::narrow_cast<std::size_t>(start - section->address), data.size());
    auto end_offset = data.size();
    if (end != 0) {
        end_offset = end <= section->address
                         ? 0
                         : std::min(gsl::narrow_cast<std::size_t>(end - section->address), data.size());
    }
    end_offset = std::max(end_offset, begin_offset);

    return SectionData{section, data.subspan(begin_offset, end_offset - begin_offset)};
}

void ObjectInfo::add_split(Address address, Split split) {
    splits.add(address, std::move(split));
}

bool ObjectInfo::is_blocked(Address address) const {
    auto it = blocked_ranges.upper_bound(address);
    if (it == blocked_ranges.begin()) {
        return false;
    }
    --it;

    return address < it->second;
}

} // namespace objmodel
