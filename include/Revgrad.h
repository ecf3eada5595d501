#ifndef REVGRAD_LIBRARY_H
#define REVGRAD_LIBRARY_H

#include "../src/common/error.hpp"
#include "../src/common/naming.hpp"
#include "../src/common/scope.hpp"

#include "../src/gradient/engine.hpp"
#include "../src/gradient/custom.hpp"
#include "../src/gradient/recompute.hpp"

#include "../src/block/block.hpp"
#include "../src/layer/layer.hpp"
#include "../src/activation/activation.hpp"
#include "../src/activation/apply.hpp"
#include "../src/initialization/initialization.hpp"

#include "../src/ops/dense.hpp"
#include "../src/ops/top_k.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Scope / Workspace own parameters; every sub-function receives a Scope.
//  - Gradient::CustomGradient and Gradient::Recompute replace structural
//    differentiation of a sub-graph by a supplied or recomputed gradient.
//  - Block::Reversible builds coupling blocks whose backward rebuilds
//    activations instead of storing them.
//  - Layer:: builds sub-functions (FC, Conv2d, Pool2d, ConvGRU, ...) usable as f / g.

#endif // REVGRAD_LIBRARY_H
