#pragma once

/// Convenience umbrella header for the Strata library.

#include <strata/core/bitmap.hpp>
#include <strata/core/encoding.hpp>
#include <strata/core/table.hpp>
#include <strata/core/types.hpp>
#include <strata/query/error.hpp>
#include <strata/query/filter.hpp>
#include <strata/query/group_by.hpp>
#include <strata/query/hash_join.hpp>
#include <strata/query/key.hpp>
#include <strata/query/scalar.hpp>
