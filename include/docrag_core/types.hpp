#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. docrag_core/types/chunk.hpp),
// users can simply do `#include "docrag_core/types.hpp"`.
//
#include "docrag_core/types/chunk.hpp"
#include "docrag_core/types/document_index.hpp"
#include "docrag_core/types/query_options.hpp"
