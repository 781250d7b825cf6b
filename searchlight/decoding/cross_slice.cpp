#include "searchlight/decoding/cross_slice.hpp"

#include <functional>
#include <sstream>
#include <vector>

#include "searchlight/base/errors.h"
#include "searchlight/base/string_utils.h"
#include "searchlight/decoding/output_shape.hpp"

namespace searchlight {
namespace decoding {

using models::base::Method;

torch::Tensor stack_slices(const torch::Tensor& X) {
    const int64_t n_samples  = X.size(0);
    const int64_t n_features = X.size(1);
    const int64_t n_slices   = X.size(2);
    // (features, samples, slices) -> (features, samples * slices) -> transposed
    return X.transpose(0, 1).reshape({n_features, n_samples * n_slices}).t();
}

namespace {

// flat (samples * slices, ...) output back to (samples, slices, ...)
torch::Tensor unstack_slices(const torch::Tensor& flat, int64_t n_samples, int64_t n_slices) {
    if (flat.dim() == 0 || flat.size(0) != n_samples * n_slices) {
        std::ostringstream err_string;
        err_string << "model returned " << base::shape2string(flat.sizes()) << " for " << n_samples * n_slices
                   << " stacked rows";
        throw ShapeError(err_string.str());
    }
    std::vector<int64_t> shape{n_samples, n_slices};
    for (int64_t d = 1; d < flat.dim(); d++) {
        shape.push_back(flat.size(d));
    }
    return flat.reshape(shape);
}

// X: (chunk samples, features, slices)
torch::Tensor apply_chunk(const Ensemble& estimators, const torch::Tensor& X, Method method) {
    const int64_t n_samples    = X.size(0);
    const int64_t n_slices     = X.size(2);
    const int64_t n_estimators = static_cast<int64_t>(estimators.size());

    torch::Tensor X_stack = stack_slices(X);
    LazyOutput y_pred({n_samples, n_estimators, n_slices}, {n_samples, n_slices});
    for (int64_t idx = 0; idx < n_estimators; idx++) {
        torch::Tensor unit = unstack_slices(estimators[idx]->apply(method, X_stack), n_samples, n_slices);
        y_pred.accept(unit).select(1, idx).copy_(unit);
    }
    return y_pred.tensor();
}

// X: (samples, features, chunk slices)
torch::Tensor score_chunk(const Ensemble& estimators, const torch::Tensor& X, const torch::Tensor& y) {
    const int64_t n_slices     = X.size(2);
    const int64_t n_estimators = static_cast<int64_t>(estimators.size());

    LazyOutput score({n_estimators, n_slices}, {});
    for (int64_t idx = 0; idx < n_estimators; idx++) {
        for (int64_t jdx = 0; jdx < n_slices; jdx++) {
            torch::Tensor unit = estimators[idx]->score(X.select(2, jdx), y);
            score.accept(unit).select(0, idx).select(0, jdx).copy_(unit);
        }
    }
    return score.tensor();
}

}  // namespace

torch::Tensor apply_cross_slice(const Ensemble& estimators,
                                const torch::Tensor& X,
                                Method method,
                                const ParallelSplitCoordinator& coordinator) {
    std::vector<Partition> parts = coordinator.partition(X.size(0), "samples");

    std::vector<std::function<torch::Tensor()>> units;
    units.reserve(parts.size());
    for (const Partition& part : parts) {
        torch::Tensor X_chunk = X.slice(0, part.begin, part.end);
        units.push_back([&estimators, X_chunk, method]() { return apply_chunk(estimators, X_chunk, method); });
    }
    return ParallelSplitCoordinator::merge(coordinator.run(units), 0);
}

// TODO: one task per test-slice chunk keeps every estimator's scoring inputs alive in each worker;
// chunking over (estimator, slice) pairs would bound that for large slice counts.
torch::Tensor score_cross_slice(const Ensemble& estimators,
                                const torch::Tensor& X,
                                const torch::Tensor& y,
                                const ParallelSplitCoordinator& coordinator) {
    std::vector<Partition> parts = coordinator.partition(X.size(2), "slices");

    std::vector<std::function<torch::Tensor()>> units;
    units.reserve(parts.size());
    for (const Partition& part : parts) {
        torch::Tensor X_chunk = X.slice(2, part.begin, part.end);
        units.push_back([&estimators, X_chunk, &y]() { return score_chunk(estimators, X_chunk, y); });
    }
    return ParallelSplitCoordinator::merge(coordinator.run(units), 1);
}

}  // namespace decoding
}  // namespace searchlight
