#ifndef FLOWBENCH_LIBRARY_H
#define FLOWBENCH_LIBRARY_H

#include "../src/core.hpp"
#include "../src/common/config.hpp"
#include "../src/data/data.hpp"
#include "../src/distributed/distributed.hpp"
#include "../src/evaluation/evaluation.hpp"
#include "../src/loss/loss.hpp"
#include "../src/metric/metric.hpp"
#include "../src/model/model.hpp"
#include "../src/training/trainer.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Header-only: every module lives under src/ as a facade plus details/.
//  - Applications include this file and link LibTorch and Boost.

#endif // FLOWBENCH_LIBRARY_H
