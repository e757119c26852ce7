#pragma once

#include <objmodel/common/error_types.hpp>
#include <objmodel/diagnostics/sink.hpp>
#include <objmodel/sections/relocation.hpp>
#include <objmodel/symbols/symbol.hpp>

#include <gsl/assert>
#include <range/v3/view/all.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/indices.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/map.hpp>
#include <range/v3/view/subrange.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace objmodel {

struct Section;

/// Index and symbol, as yielded by the SymbolTable views
using SymbolRef = std::pair<SymbolIndex, const Symbol*>;

/// Rank of ``symbol`` as the target of a relocation of kind ``kind`` when several
/// symbols share one address. Higher is better.
int relocation_target_score(const Symbol& symbol, RelocationKind kind) noexcept;

namespace detail {

struct IndexToRef
{
    const std::vector<Symbol>* symbols;

    SymbolRef operator()(SymbolIndex idx) const { return SymbolRef{idx, &(*symbols)[idx]}; }
};

/// Symbols of the address buckets in [first, last), skipping absolute ones
template <typename BucketIt>
auto sectioned_symbols(BucketIt first, BucketIt last, const std::vector<Symbol>* symbols) {
    return ranges::make_subrange(first, last) | ranges::views::values | ranges::views::join |
           ranges::views::transform(IndexToRef{symbols}) |
           ranges::views::filter([](const SymbolRef& ref) { return ref.second->section.has_value(); });
}

} // namespace detail

/// Symbols of one object, indexed by address and by name.
///
/// Symbols are stored in an append-only arena and referred to by SymbolIndex.
/// Indices are never invalidated: symbols are never removed, and ``replace``
/// overwrites a symbol in place without changing its address.
class SymbolTable
{
public:
    using Bucket = std::vector<SymbolIndex>;
    using AddressIndex = std::map<Address, Bucket>;

    SymbolTable() = default;

    /// Seed the table; symbols are stored as-is, in order
    explicit SymbolTable(std::vector<Symbol> symbols);

    /// Insert ``in_symbol``, or fold it into a matching symbol at the same address.
    ///
    /// A symbol matches if it has the same kind (or is an Unknown placeholder label),
    /// and either belongs to a section or has the same name.
    /// With ``merge``, the matching symbol takes on the incoming name, section, flags, and kind.
    /// Without it, only a missing size is filled in.
    Result<SymbolIndex> add(Symbol in_symbol, bool merge);

    /// Append without looking for an existing symbol
    SymbolIndex add_direct(Symbol in_symbol);

    /// Overwrite the symbol at ``index``. The address may not change.
    Result<void> replace(SymbolIndex index, Symbol symbol);

    const Symbol& at(SymbolIndex index) const {
        Expects(index < symbols_.size());
        return symbols_[index];
    }

    Address address_of(SymbolIndex index) const { return at(index).address; }

    std::size_t count() const noexcept { return symbols_.size(); }

    /// All symbols, in table (insertion) order
    std::span<const Symbol> iter() const noexcept { return symbols_; }

    /// Symbols at exactly ``address``, in insertion order
    auto at_address(Address address) const {
        return ranges::views::all(bucket_at(address)) | ranges::views::transform(detail::IndexToRef{&symbols_});
    }

    /// The single symbol of ``kind`` at ``address``, if any.
    /// More than one is an error: the input is inconsistent.
    Result<std::optional<SymbolIndex>> kind_at_address(Address address, SymbolKind kind) const;

    /// All symbols, absolute ones included, in ascending address order
    auto iter_ordered() const {
        return symbols_by_address_ | ranges::views::values | ranges::views::join |
               ranges::views::transform(detail::IndexToRef{&symbols_});
    }

    /// (address, bucket) pairs for [start, end)
    auto indexes_for_range(Address start, Address end) const {
        return ranges::make_subrange(symbols_by_address_.lower_bound(start), symbols_by_address_.lower_bound(end));
    }

    /// (address, bucket) pairs for [start, last]. Reaches the top of the address space
    auto indexes_for_range_inclusive(Address start, Address last) const {
        return ranges::make_subrange(symbols_by_address_.lower_bound(start), symbols_by_address_.upper_bound(last));
    }

    /// Symbols in [start, end), in ascending address order. Absolute symbols are skipped
    auto for_range(Address start, Address end) const {
        return detail::sectioned_symbols(symbols_by_address_.lower_bound(start), symbols_by_address_.lower_bound(end),
                                         &symbols_);
    }

    /// As ``for_range``, for [start, last]
    auto for_range_inclusive(Address start, Address last) const {
        return detail::sectioned_symbols(symbols_by_address_.lower_bound(start), symbols_by_address_.upper_bound(last),
                                         &symbols_);
    }

    /// Symbols within the bounds of ``section`` that belong to it
    std::vector<SymbolRef> for_section(const Section& section) const;

    /// All symbols named ``name``, in insertion order
    auto for_name(std::string_view name) const {
        return ranges::views::all(bucket_named(name)) | ranges::views::transform(detail::IndexToRef{&symbols_});
    }

    /// The single symbol named ``name``, if any.
    /// More than one is an error; it is never silently resolved.
    Result<std::optional<SymbolIndex>> by_name(std::string_view name) const;

    /// All symbols of ``kind``, in table order
    auto by_kind(SymbolKind kind) const {
        return ranges::views::indices(symbols_.size()) |
               ranges::views::filter([this, kind](SymbolIndex idx) { return symbols_[idx].kind == kind; }) |
               ranges::views::transform(detail::IndexToRef{&symbols_});
    }

    /// Find the symbol a relocation of ``kind`` pointing at ``target_address`` refers to.
    ///
    /// Walks down from ``target_address`` one address at a time. At each address the best
    /// candidate (see ``relocation_target_score``) is taken. It is the result if it starts at
    /// the target, or if it is sized and spans the target. The walk stops at the first sized
    /// candidate.
    std::optional<SymbolIndex> for_relocation(Address target_address, RelocationKind kind) const;

    /// Redirect soft conflicts (e.g. differing sizes) to ``sink``. Defaults to LogSink
    void set_diagnostic_sink(DiagnosticSink& sink) noexcept { sink_ = &sink; }

private:
    const Bucket& bucket_at(Address address) const;
    const Bucket& bucket_named(std::string_view name) const;

    /// Find a symbol that ``in_symbol`` should be folded into
    std::optional<SymbolIndex> find_merge_target(const Symbol& in_symbol) const;

    /// Select the best relocation target of a bucket
    SymbolIndex best_candidate(const Bucket& bucket, RelocationKind kind) const;

    void index_name(const std::string& name, SymbolIndex index);
    void unindex_name(const std::string& name, SymbolIndex index);

    std::vector<Symbol> symbols_;
    AddressIndex symbols_by_address_;
    std::map<std::string, Bucket, std::less<>> symbols_by_name_;

    DiagnosticSink* sink_ = nullptr;
};

} // namespace objmodel
