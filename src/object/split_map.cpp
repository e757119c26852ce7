#include "object/split_map.hpp"

#include "logging.hpp"

#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/map.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <optional>
#include <utility>

namespace objmodel {

void SplitMap::add(Address address, Split split) {
    LOG_DEBUG("Adding split @ {:#010X}: {}", address, split);

    // TODO: merge with the preceding split when it belongs to the same unit and ends at `address`
    splits_[address].push_back(std::move(split));
}

std::optional<SplitRef> SplitMap::split_for(Address address) const {
    auto it = splits_.upper_bound(address);
    if (it == splits_.begin()) {
        return std::nullopt;
    }
    --it;

    const auto& [start, splits] = *it;
    const Split& split = splits.back();

    if (split.end == 0 || split.end > address) {
        return SplitRef{start, &split};
    }

    return std::nullopt;
}

std::size_t SplitMap::count() const noexcept {
    return ranges::accumulate(splits_ | ranges::views::values |
                                  ranges::views::transform([](const auto& splits) { return splits.size(); }),
                              std::size_t{0});
}

} // namespace objmodel
