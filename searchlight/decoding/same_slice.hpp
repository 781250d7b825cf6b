#pragma once
#include <torch/torch.h>

#include "searchlight/decoding/partition.hpp"
#include "searchlight/decoding/slice_fit.hpp"
#include "searchlight/models/base/model.hpp"

namespace searchlight {
namespace decoding {

/**
 * Search-light apply: estimator i on slice i of X only.
 * X is (samples x features x slices) with one slice per estimator.
 * Returns (samples, slices, ...) where ... is the per-call output shape
 * past its sample dimension. Chunks are split along samples.
 * **/
torch::Tensor apply_same_slice(const Ensemble& estimators,
                               const torch::Tensor& X,
                               models::base::Method method,
                               const ParallelSplitCoordinator& coordinator);

/**
 * Search-light score: estimators[i].score(X[:, :, i], y).
 * Returns (slices, ...) where ... is the shape of one score. Chunks are split
 * along slices, each estimator travelling with its slice.
 * **/
torch::Tensor score_same_slice(const Ensemble& estimators,
                               const torch::Tensor& X,
                               const torch::Tensor& y,
                               const ParallelSplitCoordinator& coordinator);

}  // namespace decoding
}  // namespace searchlight
