#pragma once

/// Convenience umbrella header for the fxgen library.

#include <fxgen/core/column.hpp>
#include <fxgen/core/time.hpp>
#include <fxgen/io/csv.hpp>
#include <fxgen/series/config.hpp>
#include <fxgen/series/generator.hpp>
#include <fxgen/series/table.hpp>
