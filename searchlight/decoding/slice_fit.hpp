#pragma once
#include <torch/torch.h>
#include <memory>
#include <vector>

#include "searchlight/decoding/partition.hpp"
#include "searchlight/models/base/model.hpp"

namespace searchlight {
namespace decoding {

// one fitted model per slice, index i <-> slice i
using Ensemble = std::vector<std::unique_ptr<models::base::Model>>;

/**
 * Clones `prototype` once per slice of X (samples x features x slices) and
 * fits clone i on X[:, :, i] against y.
 *
 * Slices are split into contiguous chunks, one per job; each chunk owns its
 * clones and fits them in slice order. The first failure aborts the fit and
 * the model's exception reaches the caller unchanged.
 * **/
Ensemble fit_slices(const models::base::Model& prototype,
                    const torch::Tensor& X,
                    const torch::Tensor& y,
                    const ParallelSplitCoordinator& coordinator);

}  // namespace decoding
}  // namespace searchlight
