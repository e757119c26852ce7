#include "symbols/symbol_table.hpp"

#include "common/error_types.hpp"
#include "diagnostics/log_sink.hpp"
#include "diagnostics/sink.hpp"
#include "logging.hpp"
#include "sections/relocation.hpp"
#include "sections/section.hpp"
#include "symbols/symbol.hpp"

#include <gsl/assert>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace objmodel {

int relocation_target_score(const Symbol& symbol, RelocationKind kind) noexcept {
    int score = 0;

    switch (symbol.kind) {
    case SymbolKind::Function:
    case SymbolKind::Object:
        score = is_half_address(kind) ? 1 : 2;
        break;
    case SymbolKind::Unknown:
        // Labels are what lis/addi pairs usually point at, except for jump tables
        score = is_half_address(kind) && !symbol.name.starts_with(JUMP_TABLE_LABEL_PREFIX) ? 3 : 1;
        break;
    case SymbolKind::Section:
        score = -1;
        break;
    }

    if (symbol.size > 0) {
        ++score;
    }

    return score;
}

SymbolTable::SymbolTable(std::vector<Symbol> symbols) {
    symbols_.reserve(symbols.size());

    for (auto& symbol : symbols) {
        add_direct(std::move(symbol));
    }
}

Result<SymbolIndex> SymbolTable::add(Symbol in_symbol, bool merge) {
    auto target = find_merge_target(in_symbol);

    if (!target.has_value()) {
        in_symbol.size_known = in_symbol.size != 0;
        return add_direct(std::move(in_symbol));
    }

    const SymbolIndex symbol_idx = *target;
    const Symbol& existing = symbols_[symbol_idx];

    std::uint32_t size = existing.size;
    if (existing.size_known && in_symbol.size_known && existing.size != in_symbol.size) {
        DiagnosticSink& sink = sink_ != nullptr ? *sink_ : LogSink::get();
        sink.report(Diagnostic{
            .kind = DiagnosticKind::SizeConflict,
            .symbol_name = existing.name,
            .address = existing.address,
            .old_size = existing.size,
            .new_size = in_symbol.size,
            .message = fmt::format("Conflicting size for {}: was {:#X}, now {:#X}", existing.name, existing.size,
                                   in_symbol.size),
        });

        if (merge) {
            size = in_symbol.size;
        }
    } else if (in_symbol.size_known) {
        size = in_symbol.size;
    }

    if (!merge) {
        // Not replacing the existing symbol, but fill in a size if we now have one
        if (in_symbol.size_known && !existing.size_known) {
            Symbol updated = existing;
            updated.size = in_symbol.size;
            updated.size_known = true;
            TRY(replace(symbol_idx, std::move(updated)));
        }
        return symbol_idx;
    }

    Symbol merged{
        .name = std::move(in_symbol.name),
        .demangled_name = std::move(in_symbol.demangled_name),
        .address = in_symbol.address,
        .section = in_symbol.section,
        .size = size,
        .size_known = existing.size_known || in_symbol.size != 0,
        .flags = in_symbol.flags,
        .kind = in_symbol.kind,
        .align = in_symbol.align.has_value() ? in_symbol.align : existing.align,
        .data_kind = in_symbol.data_kind == DataKind::Unknown ? existing.data_kind : in_symbol.data_kind,
    };

    if (merged != existing) {
        LOG_DEBUG("Replacing {} with {}", existing, merged);
        TRY(replace(symbol_idx, std::move(merged)));
    }

    return symbol_idx;
}

SymbolIndex SymbolTable::add_direct(Symbol in_symbol) {
    const SymbolIndex symbol_idx = symbols_.size();

    symbols_by_address_[in_symbol.address].push_back(symbol_idx);
    index_name(in_symbol.name, symbol_idx);
    symbols_.push_back(std::move(in_symbol));

    return symbol_idx;
}

Result<void> SymbolTable::replace(SymbolIndex index, Symbol symbol) {
    Expects(index < symbols_.size());

    Symbol& current = symbols_[index];

    if (current.address != symbol.address) {
        return make_error(ErrorKind::AddressImmutable,
                          "Can't modify address of {} ({:#010X} -> {:#010X}) with replace", current.name,
                          current.address, symbol.address);
    }

    if (current.name != symbol.name) {
        unindex_name(current.name, index);
        index_name(symbol.name, index);
    }

    current = std::move(symbol);

    return {};
}

Result<std::optional<SymbolIndex>> SymbolTable::kind_at_address(Address address, SymbolKind kind) const {
    const Bucket& bucket = bucket_at(address);
    auto of_kind = [this, kind](SymbolIndex idx) { return symbols_[idx].kind == kind; };

    const auto count = ranges::count_if(bucket, of_kind);
    if (count > 1) {
        return make_error(ErrorKind::AmbiguousSymbol, "Multiple symbols of kind {} at address {:#010X}", kind,
                          address);
    }

    if (auto it = ranges::find_if(bucket, of_kind); it != bucket.end()) {
        return std::optional<SymbolIndex>{*it};
    }

    return std::optional<SymbolIndex>{};
}

std::vector<SymbolRef> SymbolTable::for_section(const Section& section) const {
    if (section.size == 0) {
        return {};
    }

    // The last address always fits, even when the section ends at the top of the address space
    const auto last = static_cast<Address>(section.end() - 1);

    return for_range_inclusive(section.address, last) | ranges::views::filter([&section](const SymbolRef& ref) {
               return ref.second->section == section.index;
           }) |
           ranges::to<std::vector>();
}

Result<std::optional<SymbolIndex>> SymbolTable::by_name(std::string_view name) const {
    const Bucket& bucket = bucket_named(name);

    if (bucket.size() > 1) {
        const Symbol& first = symbols_[bucket[0]];
        const Symbol& second = symbols_[bucket[1]];
        return make_error(ErrorKind::AmbiguousSymbol,
                          "Multiple symbols with name {}: {} {} {:#010X} and {} {} {:#010X}", name, bucket[0],
                          first.kind, first.address, bucket[1], second.kind, second.address);
    }

    if (bucket.empty()) {
        return std::optional<SymbolIndex>{};
    }

    return std::optional<SymbolIndex>{bucket.front()};
}

std::optional<SymbolIndex> SymbolTable::for_relocation(Address target_address, RelocationKind kind) const {
    // Walk buckets downwards, starting with the one at or immediately below the target
    auto it = symbols_by_address_.upper_bound(target_address);

    while (it != symbols_by_address_.begin()) {
        --it;

        const Bucket& bucket = it->second;
        DEBUG_ASSERT(!bucket.empty());

        const SymbolIndex symbol_idx = bucket.size() == 1 ? bucket.front() : best_candidate(bucket, kind);
        const Symbol& symbol = symbols_[symbol_idx];

        if (symbol.address == target_address) {
            LOG_TRACE("Relocation ({}) to {:#010X} resolved to {}", kind, target_address, symbol);
            return symbol_idx;
        }

        if (symbol.size > 0) {
            if (std::uint64_t{symbol.address} + symbol.size > target_address) {
                LOG_TRACE("Relocation ({}) to {:#010X} resolved to {} (+{:#X})", kind, target_address, symbol,
                          target_address - symbol.address);
                return symbol_idx;
            }
            // A sized symbol ends before the target; nothing further down can cover it
            break;
        }
    }

    LOG_TRACE("Relocation ({}) to {:#010X} has no target symbol", kind, target_address);
    return std::nullopt;
}

const SymbolTable::Bucket& SymbolTable::bucket_at(Address address) const {
    static const Bucket empty_bucket{};

    auto it = symbols_by_address_.find(address);
    return it == symbols_by_address_.end() ? empty_bucket : it->second;
}

const SymbolTable::Bucket& SymbolTable::bucket_named(std::string_view name) const {
    static const Bucket empty_bucket{};

    auto it = symbols_by_name_.find(name);
    return it == symbols_by_name_.end() ? empty_bucket : it->second;
}

std::optional<SymbolIndex> SymbolTable::find_merge_target(const Symbol& in_symbol) const {
    const Bucket& bucket = bucket_at(in_symbol.address);

    auto it = ranges::find_if(bucket, [this, &in_symbol](SymbolIndex idx) {
        const Symbol& symbol = symbols_[idx];

        // Real symbols replace placeholder labels
        const bool kind_matches =
            symbol.kind == in_symbol.kind ||
            (symbol.kind == SymbolKind::Unknown && symbol.name.starts_with(PLACEHOLDER_LABEL_PREFIX));

        // Distinct absolute symbols may share an address; only fold those with the same name
        return kind_matches && (symbol.section.has_value() || symbol.name == in_symbol.name);
    });

    if (it == bucket.end()) {
        return std::nullopt;
    }

    return *it;
}

SymbolIndex SymbolTable::best_candidate(const Bucket& bucket, RelocationKind kind) const {
    // max_element yields the first of equal elements, so ties go to the earliest inserted symbol
    auto score = [this, kind](SymbolIndex idx) { return relocation_target_score(symbols_[idx], kind); };
    auto it = ranges::max_element(bucket, ranges::less{}, score);

    return *it;
}

void SymbolTable::index_name(const std::string& name, SymbolIndex index) {
    if (name.empty()) {
        return;
    }

    auto it = symbols_by_name_.find(name);
    if (it == symbols_by_name_.end()) {
        symbols_by_name_.emplace(name, Bucket{index});
    } else {
        it->second.push_back(index);
    }
}

void SymbolTable::unindex_name(const std::string& name, SymbolIndex index) {
    if (name.empty()) {
        return;
    }

    auto it = symbols_by_name_.find(name);
    ASSERT(it != symbols_by_name_.end(), "Symbol name missing from name index", name, index);

    Bucket& bucket = it->second;
    if (auto pos = ranges::find(bucket, index); pos != bucket.end()) {
        bucket.erase(pos);
    }

    if (bucket.empty()) {
        symbols_by_name_.erase(it);
    }
}

} // namespace objmodel
