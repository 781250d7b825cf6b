#pragma once
#include <torch/torch.h>

#include "searchlight/decoding/partition.hpp"
#include "searchlight/decoding/slice_fit.hpp"
#include "searchlight/models/base/model.hpp"

namespace searchlight {
namespace decoding {

/**
 * (samples x features x slices) -> ((samples * slices) x features),
 * row a * slices + j holding X[a, :, j].
 * **/
torch::Tensor stack_slices(const torch::Tensor& X);

/**
 * Generalization apply: every estimator on every slice of X.
 *
 * X may hold any number of slices. Each estimator is called once on the
 * stacked slices (see stack_slices) and its flat output is reshaped back to
 * (samples, slices, ...). Estimators must treat rows independently at
 * inference, so this equals calling them slice by slice.
 *
 * Returns (samples, n_estimators, slices, ...). Chunks are split along samples.
 * **/
torch::Tensor apply_cross_slice(const Ensemble& estimators,
                                const torch::Tensor& X,
                                models::base::Method method,
                                const ParallelSplitCoordinator& coordinator);

/**
 * Generalization score: estimators[i].score(X[:, :, j], y) for every (i, j).
 *
 * Scores reduce over samples, so slices cannot be stacked here and every
 * (estimator, slice) pair is scored on its own. Returns (n_estimators, slices,
 * ...). Chunks are split along the slices of X.
 * **/
torch::Tensor score_cross_slice(const Ensemble& estimators,
                                const torch::Tensor& X,
                                const torch::Tensor& y,
                                const ParallelSplitCoordinator& coordinator);

}  // namespace decoding
}  // namespace searchlight
