#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. ragline_core/types/fragment.hpp),
// users can simply do `#include "ragline_core/types.hpp"`.
//
#include "ragline_core/types/document.hpp"
#include "ragline_core/types/fragment.hpp"
