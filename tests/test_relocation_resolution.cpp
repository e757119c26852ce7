#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include "sections/relocation.hpp"
#include "symbols/symbol.hpp"
#include "symbols/symbol_table.hpp"

#include <optional>
#include <string>
#include <tuple>

using namespace objmodel;
using objmodel::test::make_symbol;

TEST_CASE("Relocation target scores") {
    SECTION("Functions and objects prefer full addresses") {
        const Symbol func = make_symbol("func", 0x100, SymbolKind::Function);

        REQUIRE(relocation_target_score(func, RelocationKind::Absolute) == 2);
        REQUIRE(relocation_target_score(func, RelocationKind::Rel24) == 2);
        REQUIRE(relocation_target_score(func, RelocationKind::AddrHa) == 1);
        REQUIRE(relocation_target_score(make_symbol("obj", 0x100, SymbolKind::Object, 4), RelocationKind::AddrLo) ==
                2);
    }

    SECTION("Labels prefer half addresses") {
        auto [kind, expected] = GENERATE(table<RelocationKind, int>({
            {RelocationKind::AddrHi, 3},
            {RelocationKind::AddrHa, 3},
            {RelocationKind::AddrLo, 3},
            {RelocationKind::Absolute, 1},
            {RelocationKind::Rel24, 1},
            {RelocationKind::Rel14, 1},
            {RelocationKind::EmbeddedSmallData21, 1},
        }));

        CAPTURE(kind);
        REQUIRE(relocation_target_score(make_symbol("lbl_80001000", 0x100, SymbolKind::Unknown), kind) == expected);
    }

    SECTION("Jump table labels get no half address preference") {
        const Symbol jump_table = make_symbol("..L_80001000", 0x100, SymbolKind::Unknown);

        REQUIRE(relocation_target_score(jump_table, RelocationKind::AddrHa) == 1);
        REQUIRE(relocation_target_score(jump_table, RelocationKind::AddrLo) == 1);
    }

    SECTION("Section symbols rank below everything") {
        REQUIRE(relocation_target_score(make_symbol(".data", 0x100, SymbolKind::Section), RelocationKind::Absolute) ==
                -1);
        REQUIRE(relocation_target_score(make_symbol(".data", 0x100, SymbolKind::Section, 0x100),
                                        RelocationKind::Absolute) == 0);
    }
}

TEST_CASE("Resolve relocations against neighbouring symbols") {
    SymbolTable table;
    const SymbolIndex obj_a = table.add_direct(make_symbol("A", 0x100, SymbolKind::Object, 4));
    const SymbolIndex label_b = table.add_direct(make_symbol("B", 0x104, SymbolKind::Unknown));

    // Inside a sized symbol
    REQUIRE(table.for_relocation(0x102, RelocationKind::Absolute) == std::optional<SymbolIndex>{obj_a});
    // Exactly at an unsized one
    REQUIRE(table.for_relocation(0x104, RelocationKind::Absolute) == std::optional<SymbolIndex>{label_b});
    // Past B, which has no extent, and past the end of A
    REQUIRE(table.for_relocation(0x108, RelocationKind::Absolute) == std::nullopt);
    // Below every symbol
    REQUIRE(table.for_relocation(0x0FF, RelocationKind::Absolute) == std::nullopt);
}

TEST_CASE("Resolve against an empty table") {
    const SymbolTable table;

    REQUIRE(table.for_relocation(0x80001000, RelocationKind::Rel24) == std::nullopt);
}

TEST_CASE("Choose between symbols at one address") {
    SymbolTable table;

    SECTION("Half addresses prefer labels, full addresses prefer objects") {
        const SymbolIndex obj = table.add_direct(make_symbol("obj", 0x200, SymbolKind::Object));
        const SymbolIndex label = table.add_direct(make_symbol("lbl_200", 0x200, SymbolKind::Unknown));

        REQUIRE(table.for_relocation(0x200, RelocationKind::AddrHa) == std::optional<SymbolIndex>{label});
        REQUIRE(table.for_relocation(0x200, RelocationKind::AddrLo) == std::optional<SymbolIndex>{label});
        REQUIRE(table.for_relocation(0x200, RelocationKind::Absolute) == std::optional<SymbolIndex>{obj});
    }

    SECTION("Ties go to the earliest inserted symbol") {
        const SymbolIndex first = table.add_direct(make_symbol("first", 0x300, SymbolKind::Object, 4));
        table.add_direct(make_symbol("second", 0x300, SymbolKind::Object, 4));

        REQUIRE(table.for_relocation(0x300, RelocationKind::Absolute) == std::optional<SymbolIndex>{first});
        REQUIRE(table.for_relocation(0x302, RelocationKind::Absolute) == std::optional<SymbolIndex>{first});
    }

    SECTION("Sized symbols win over unsized ones of the same kind") {
        table.add_direct(make_symbol("unsized", 0x300, SymbolKind::Object));
        const SymbolIndex sized = table.add_direct(make_symbol("sized", 0x300, SymbolKind::Object, 4));

        REQUIRE(table.for_relocation(0x300, RelocationKind::Absolute) == std::optional<SymbolIndex>{sized});
    }

    SECTION("Jump table labels lose to sized functions") {
        table.add_direct(make_symbol("..L_300", 0x300, SymbolKind::Unknown));
        const SymbolIndex func = table.add_direct(make_symbol("switch_fn", 0x300, SymbolKind::Function, 0x40));

        REQUIRE(table.for_relocation(0x300, RelocationKind::AddrLo) == std::optional<SymbolIndex>{func});
    }

    SECTION("Section symbols are a last resort") {
        table.add_direct(make_symbol(".data", 0x400, SymbolKind::Section, 0x100));
        const SymbolIndex label = table.add_direct(make_symbol("lbl_400", 0x400, SymbolKind::Unknown));

        REQUIRE(table.for_relocation(0x400, RelocationKind::Absolute) == std::optional<SymbolIndex>{label});
    }
}

TEST_CASE("Walk down past unsized symbols") {
    SymbolTable table;
    const SymbolIndex func = table.add_direct(make_symbol("func", 0x1F0, SymbolKind::Function, 0x20));
    table.add_direct(make_symbol("lbl_200", 0x200, SymbolKind::Unknown));

    REQUIRE(table.for_relocation(0x208, RelocationKind::Rel24) == std::optional<SymbolIndex>{func});
    REQUIRE(table.for_relocation(0x210, RelocationKind::Rel24) == std::nullopt);
}

TEST_CASE("Stop at the first sized symbol") {
    SymbolTable table;
    table.add_direct(make_symbol("outer", 0x0F0, SymbolKind::Object, 0x100));
    const SymbolIndex inner = table.add_direct(make_symbol("inner", 0x100, SymbolKind::Function, 4));

    REQUIRE(table.for_relocation(0x102, RelocationKind::Absolute) == std::optional<SymbolIndex>{inner});
    // "outer" spans the target, but "inner" is closer and ends before it
    REQUIRE(table.for_relocation(0x110, RelocationKind::Absolute) == std::nullopt);
}
