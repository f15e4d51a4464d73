#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. kb_core/types/document.hpp),
// users can simply do `#include "kb_core/types.hpp"`.
//
#include "kb_core/types/document.hpp"
#include "kb_core/types/chunk.hpp"
