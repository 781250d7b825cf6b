#include "searchlight/decoding/slice_fit.hpp"

#include <glog/logging.h>
#include <exception>
#include <functional>
#include <utility>

namespace searchlight {
namespace decoding {

namespace {

int64_t fit_chunk(Ensemble* chunk, const Partition& part, const torch::Tensor& X, const torch::Tensor& y) {
    for (int64_t idx = 0; idx < part.size(); idx++) {
        const int64_t slice = part.begin + idx;
        try {
            (*chunk)[idx]->fit(X.select(2, slice), y);
        } catch (const std::exception& e) {
            LOG(ERROR) << "fit failed on slice " << slice << ": " << e.what();
            throw;
        }
    }
    return part.size();
}

}  // namespace

Ensemble fit_slices(const models::base::Model& prototype,
                    const torch::Tensor& X,
                    const torch::Tensor& y,
                    const ParallelSplitCoordinator& coordinator) {
    std::vector<Partition> parts = coordinator.partition(X.size(2), "slices");

    // clone before dispatch => no worker ever touches the prototype
    std::vector<Ensemble> chunks(parts.size());
    for (size_t p = 0; p < parts.size(); p++) {
        chunks[p].reserve(static_cast<size_t>(parts[p].size()));
        for (int64_t idx = 0; idx < parts[p].size(); idx++) {
            chunks[p].push_back(prototype.clone());
        }
    }

    std::vector<std::function<int64_t()>> units;
    units.reserve(parts.size());
    for (size_t p = 0; p < parts.size(); p++) {
        Ensemble* chunk       = &chunks[p];
        const Partition& part = parts[p];
        units.push_back([chunk, part, &X, &y]() { return fit_chunk(chunk, part, X, y); });
    }
    coordinator.run(units);

    Ensemble estimators;
    estimators.reserve(static_cast<size_t>(X.size(2)));
    for (size_t p = 0; p < chunks.size(); p++) {
        for (size_t idx = 0; idx < chunks[p].size(); idx++) {
            estimators.push_back(std::move(chunks[p][idx]));
        }
    }
    return estimators;
}

}  // namespace decoding
}  // namespace searchlight
