#ifndef TASNET_LIBRARY_H
#define TASNET_LIBRARY_H

#include "../src/core.hpp"
#include "../src/layer/layer.hpp"
#include "../src/optimizer/optimizer.hpp"

#include "../src/autoencoder/autoencoder.hpp"
#include "../src/block/block.hpp"
#include "../src/common/config.hpp"
#include "../src/common/save_load.hpp"
#include "../src/data/data.hpp"
#include "../src/separator/separator.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
// Everything is header-only under src/; downstream code includes this file and
// links LibTorch.

#endif // TASNET_LIBRARY_H
