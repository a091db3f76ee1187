#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. docqa_core/types/file.hpp),
// users can simply do `#include "docqa_core/types.hpp"`.
//
#include "docqa_core/types/chunk.hpp"
#include "docqa_core/types/file.hpp"
