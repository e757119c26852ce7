#include "symbols/symbol.hpp"

#include <initializer_list>

namespace objmodel {

SymbolFlagSet::SymbolFlagSet(std::initializer_list<SymbolFlag> flags) {
    for (auto flag : flags) {
        set(flag);
    }
}

void SymbolFlagSet::set_global() noexcept {
    bits_ = static_cast<std::uint8_t>((bits_ & ~(mask(SymbolFlag::Local) | mask(SymbolFlag::Weak))) |
                                      mask(SymbolFlag::Global));
}

void SymbolFlagSet::set_local() noexcept {
    bits_ = static_cast<std::uint8_t>((bits_ & ~mask(SymbolFlag::Global)) | mask(SymbolFlag::Local));
}

void SymbolFlagSet::set(SymbolFlag flag) noexcept {
    switch (flag) {
    case SymbolFlag::Global:
        set_global();
        break;
    case SymbolFlag::Local:
        set_local();
        break;
    case SymbolFlag::Weak:
    case SymbolFlag::Common:
    case SymbolFlag::Hidden:
    case SymbolFlag::ForceActive:
        bits_ = static_cast<std::uint8_t>(bits_ | mask(flag));
        break;
    }
}

void SymbolFlagSet::clear(SymbolFlag flag) noexcept {
    bits_ = static_cast<std::uint8_t>(bits_ & ~mask(flag));
}

} // namespace objmodel
