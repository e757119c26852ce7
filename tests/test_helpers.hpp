#pragma once

#include "diagnostics/sink.hpp"
#include "sections/section.hpp"
#include "symbols/symbol.hpp"
#include "symbols/symbol_table.hpp"

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace objmodel::test {

/// Keeps every diagnostic it receives, in order
class RecordingSink : public DiagnosticSink
{
public:
    void report(const Diagnostic& diagnostic) override { diagnostics.push_back(diagnostic); }

    std::vector<Diagnostic> diagnostics;
};

/// Symbol in section ``section`` (absolute if nullopt). A nonzero size counts as known
inline Symbol make_symbol(std::string name, Address address, SymbolKind kind, std::uint32_t size = 0,
                          std::optional<SectionIndex> section = 0) {
    return Symbol{
        .name = std::move(name),
        .address = address,
        .section = section,
        .size = size,
        .size_known = size != 0,
        .kind = kind,
    };
}

/// Section whose data bytes count up from 0 (Bss sections get none)
inline Section make_section(std::string name, SectionIndex index, Address address, std::uint32_t size,
                            SectionKind kind = SectionKind::Data) {
    std::vector<std::uint8_t> data;
    if (kind != SectionKind::Bss) {
        data.resize(size);
        for (std::uint32_t i = 0; i < size; ++i) {
            data[i] = static_cast<std::uint8_t>(i);
        }
    }

    return Section{
        .name = std::move(name),
        .kind = kind,
        .address = address,
        .size = size,
        .data = std::move(data),
        .align = 4,
        .index = index,
        .elf_index = index + 1,
        .relocations = {},
        .original_address = address,
        .file_offset = 0,
        .section_known = true,
    };
}

/// Indices of a range of SymbolRefs
template <typename Refs>
std::vector<SymbolIndex> indices_of(Refs&& refs) {
    return std::forward<Refs>(refs) | ranges::views::transform([](const SymbolRef& ref) { return ref.first; }) |
           ranges::to<std::vector>();
}

} // namespace objmodel::test
