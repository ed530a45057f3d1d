#ifndef SHEAR_LIBRARY_H
#define SHEAR_LIBRARY_H

#include "../src/core.hpp"
#include "../src/network.hpp"
#include "../src/layer/layer.hpp"

#include "../src/sparsity/sparsity.hpp"
#include "../src/mask/mask.hpp"
#include "../src/mask/apply.hpp"
#include "../src/training/controller.hpp"
#include "../src/dependency/dependency.hpp"
#include "../src/surgery/surgery.hpp"
#include "../src/evaluation/evaluation.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the graph, the pruning pipeline (schedule, masks, controller,
//    dependency walk, surgery, equivalence) and the Pruner orchestrator.
//  - Include-only: every component is a header under src/.

#endif // SHEAR_LIBRARY_H
