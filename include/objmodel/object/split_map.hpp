#pragma once

#include <objmodel/symbols/symbol.hpp>

#include <fmt/format.h>
#include <range/v3/view/for_each.hpp>
#include <range/v3/view/subrange.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace objmodel {

/// Start of a decompilation unit
struct Split
{
    std::string unit;
    /// 0: runs until the next split or the end of the section
    Address end{};
    std::optional<std::uint32_t> align;
    /// Block shared between units (.comm)
    bool common{};

    bool operator==(const Split& rhs) const = default;
};

/// Start address and split, as yielded by SplitMap views
using SplitRef = std::pair<Address, const Split*>;

namespace detail {

/// (address, [split...]) entries -> (address, split) pairs
inline auto flatten_splits() {
    return ranges::views::for_each([](const std::pair<const Address, std::vector<Split>>& entry) {
        return entry.second |
               ranges::views::transform([addr = entry.first](const Split& split) { return SplitRef{addr, &split}; });
    });
}

} // namespace detail

/// Splits keyed by start address. Several splits may start at one address;
/// they are kept in the order they were added.
///
/// Neighbouring splits of the same unit are not merged, so consumers must expect
/// adjacent and overlapping records for a unit.
class SplitMap
{
public:
    using Splits = std::map<Address, std::vector<Split>>;

    void add(Address address, Split split);

    /// The split covering ``address``: the last one starting at or below it, if it
    /// is unbounded or ends past ``address``
    std::optional<SplitRef> split_for(Address address) const;

    /// Splits starting in [start, end), by address then insertion order
    auto for_range(Address start, Address end) const {
        return ranges::make_subrange(splits_.lower_bound(start), splits_.lower_bound(end)) | detail::flatten_splits();
    }

    /// Splits starting in [start, last], by address then insertion order
    auto for_range_inclusive(Address start, Address last) const {
        return ranges::make_subrange(splits_.lower_bound(start), splits_.upper_bound(last)) | detail::flatten_splits();
    }

    /// All splits, by address then insertion order
    auto iter() const { return splits_ | detail::flatten_splits(); }

    /// Number of split records (not addresses)
    std::size_t count() const noexcept;

    bool empty() const noexcept { return splits_.empty(); }

private:
    Splits splits_;
};

} // namespace objmodel

template <>
struct fmt::formatter<::objmodel::Split> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const ::objmodel::Split& from, Context& ctx) const {
        const std::string align_str = from.align ? fmt::format("{:#X}", *from.align) : "default";

        return fmt::format_to(ctx.out(), "Split{{.unit={:?}, .end={:#010X}, .align={}, .common={}}}", from.unit,
                              from.end, align_str, from.common);
    }
};
