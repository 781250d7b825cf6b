#pragma once
#include <torch/torch.h>
#include <cstddef>
#include <memory>

#include "searchlight/base/noncopyable.h"
#include "searchlight/decoding/options.hpp"
#include "searchlight/decoding/partition.hpp"
#include "searchlight/decoding/slice_fit.hpp"
#include "searchlight/decoding/task_runner.hpp"
#include "searchlight/models/base/model.hpp"

namespace searchlight {
namespace decoding {

/**
 * Search light: fit, predict and score a series of models, one per slice of
 * the dataset along its third dimension.
 *
 * X is always (n_samples, n_features, n_slices), y is (n_samples,).
 * Estimator i is a clone of base_estimator fitted on X[:, :, i], and is
 * applied to slice i of the data it is given.
 *
 * base_estimator is only cloned, never fitted. When no runner is given, one
 * matching options.n_jobs is created.
 * **/
class SearchLight {
public:
    SearchLight(std::shared_ptr<const models::base::Model> base_estimator,
                const SearchLightOptions& options = SearchLightOptions(),
                std::shared_ptr<TaskRunner> runner = nullptr);
    virtual ~SearchLight();

    // replaces the whole ensemble; a failed fit keeps the previous one
    SearchLight& fit(const torch::Tensor& X, const torch::Tensor& y);

    torch::Tensor fit_transform(const torch::Tensor& X, const torch::Tensor& y);

    // (n_samples, n_slices, ...); falls back to predict when the model has no transform
    torch::Tensor transform(const torch::Tensor& X) const;
    // (n_samples, n_slices)
    torch::Tensor predict(const torch::Tensor& X) const;
    // (n_samples, n_slices, n_classes)
    torch::Tensor predict_proba(const torch::Tensor& X) const;
    // (n_samples, n_slices[, n_classes])
    torch::Tensor decision_function(const torch::Tensor& X) const;
    // (n_slices, ...), one score per estimator / slice couple
    virtual torch::Tensor score(const torch::Tensor& X, const torch::Tensor& y) const;

    bool is_fitted() const {
        return _fitted;
    }
    size_t n_estimators() const {
        return _estimators.size();
    }
    const models::base::Model& estimator(size_t idx) const;
    const models::base::Model& base_estimator() const {
        return *_base_estimator;
    }
    int n_jobs() const {
        return _options.n_jobs;
    }

protected:
    // shared by transform / predict / predict_proba / decision_function
    virtual torch::Tensor apply(const torch::Tensor& X, models::base::Method method) const;

    // rank-3 X with samples and slices; y, when given, 1-d with one entry per sample
    void check_Xy(const torch::Tensor& X, const torch::Tensor* y = nullptr) const;
    void check_fitted() const;
    // same-slice mode needs one estimator per slice of X
    void check_n_slices(const torch::Tensor& X) const;

    ParallelSplitCoordinator coordinator() const;

    const Ensemble& estimators() const {
        return _estimators;
    }

private:
    std::shared_ptr<const models::base::Model> _base_estimator;
    SearchLightOptions _options;
    int _n_workers;
    std::shared_ptr<TaskRunner> _runner;
    Ensemble _estimators;
    bool _fitted = false;

    DISALLOW_COPY_AND_ASSIGN(SearchLight);
};

/**
 * Generalization light: fits like SearchLight, then applies every estimator
 * to every slice of the data, which may hold a different number of slices
 * than the training data.
 * **/
class GeneralizationLight : public SearchLight {
public:
    GeneralizationLight(std::shared_ptr<const models::base::Model> base_estimator,
                        const SearchLightOptions& options = SearchLightOptions(),
                        std::shared_ptr<TaskRunner> runner = nullptr);

    // (n_estimators, n_slices, ...)
    torch::Tensor score(const torch::Tensor& X, const torch::Tensor& y) const override;

protected:
    // (n_samples, n_estimators, n_slices, ...)
    torch::Tensor apply(const torch::Tensor& X, models::base::Method method) const override;
};

}  // namespace decoding
}  // namespace searchlight
