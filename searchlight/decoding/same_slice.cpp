#include "searchlight/decoding/same_slice.hpp"

#include <glog/logging.h>
#include <functional>
#include <vector>

#include "searchlight/decoding/output_shape.hpp"

namespace searchlight {
namespace decoding {

using models::base::Method;

namespace {

// X: (chunk samples, features, slices)
torch::Tensor apply_chunk(const Ensemble& estimators, const torch::Tensor& X, Method method) {
    const int64_t n_samples = X.size(0);
    const int64_t n_slices  = X.size(2);

    LazyOutput y_pred({n_samples, n_slices}, {n_samples});
    for (int64_t idx = 0; idx < n_slices; idx++) {
        torch::Tensor unit = estimators[idx]->apply(method, X.select(2, idx));
        y_pred.accept(unit).select(1, idx).copy_(unit);
    }
    return y_pred.tensor();
}

torch::Tensor score_chunk(const Ensemble& estimators, const Partition& part, const torch::Tensor& X,
                          const torch::Tensor& y) {
    LazyOutput score({part.size()}, {});
    for (int64_t idx = part.begin; idx < part.end; idx++) {
        torch::Tensor unit = estimators[idx]->score(X.select(2, idx), y);
        score.accept(unit).select(0, idx - part.begin).copy_(unit);
    }
    return score.tensor();
}

}  // namespace

torch::Tensor apply_same_slice(const Ensemble& estimators,
                               const torch::Tensor& X,
                               Method method,
                               const ParallelSplitCoordinator& coordinator) {
    CHECK_EQ(static_cast<int64_t>(estimators.size()), X.size(2));
    std::vector<Partition> parts = coordinator.partition(X.size(0), "samples");

    std::vector<std::function<torch::Tensor()>> units;
    units.reserve(parts.size());
    for (const Partition& part : parts) {
        torch::Tensor X_chunk = X.slice(0, part.begin, part.end);
        units.push_back([&estimators, X_chunk, method]() { return apply_chunk(estimators, X_chunk, method); });
    }
    return ParallelSplitCoordinator::merge(coordinator.run(units), 0);
}

torch::Tensor score_same_slice(const Ensemble& estimators,
                               const torch::Tensor& X,
                               const torch::Tensor& y,
                               const ParallelSplitCoordinator& coordinator) {
    CHECK_EQ(static_cast<int64_t>(estimators.size()), X.size(2));
    std::vector<Partition> parts = coordinator.partition(X.size(2), "slices");

    std::vector<std::function<torch::Tensor()>> units;
    units.reserve(parts.size());
    for (const Partition& part : parts) {
        units.push_back([&estimators, part, &X, &y]() { return score_chunk(estimators, part, X, y); });
    }
    return ParallelSplitCoordinator::merge(coordinator.run(units), 0);
}

}  // namespace decoding
}  // namespace searchlight
