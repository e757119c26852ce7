#pragma once

#include <objmodel/common/error_types.hpp>    // IWYU pragma: export
#include <objmodel/common/expected.hpp>       // IWYU pragma: export
#include <objmodel/diagnostics/log_sink.hpp>  // IWYU pragma: export
#include <objmodel/diagnostics/sink.hpp>      // IWYU pragma: export
#include <objmodel/logging.hpp>               // IWYU pragma: export
#include <objmodel/object/object_info.hpp>    // IWYU pragma: export
#include <objmodel/object/split_map.hpp>      // IWYU pragma: export
#include <objmodel/sections/relocation.hpp>   // IWYU pragma: export
#include <objmodel/sections/section.hpp>      // IWYU pragma: export
#include <objmodel/symbols/symbol.hpp>        // IWYU pragma: export
#include <objmodel/symbols/symbol_table.hpp>  // IWYU pragma: export
