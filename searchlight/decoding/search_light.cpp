#include "searchlight/decoding/search_light.hpp"

#include <glog/logging.h>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "searchlight/base/errors.h"
#include "searchlight/base/string_utils.h"
#include "searchlight/base/timer.h"
#include "searchlight/decoding/cross_slice.hpp"
#include "searchlight/decoding/same_slice.hpp"

namespace searchlight {
namespace decoding {

using models::base::Method;
using models::base::Model;
using models::base::method_name;
using models::base::resolve_method;

/**
 * implementation: SearchLight
 * **/
SearchLight::SearchLight(std::shared_ptr<const Model> base_estimator,
                         const SearchLightOptions& options,
                         std::shared_ptr<TaskRunner> runner) : _base_estimator(std::move(base_estimator)),
                                                               _options(options),
                                                               _n_workers(1),
                                                               _runner(std::move(runner)) {
    if (!_base_estimator) {
        throw std::invalid_argument("base_estimator must not be null");
    }
    validate(_options);
    _n_workers = resolve_n_jobs(_options.n_jobs);
    if (!_runner) {
        _runner = make_task_runner(_options.n_jobs);
    }
}

SearchLight::~SearchLight() {}

SearchLight& SearchLight::fit(const torch::Tensor& X, const torch::Tensor& y) {
    this->check_Xy(X, &y);
    resolve_method(*_base_estimator, Method::kFit);

    base::Timer timer("fit");
    Ensemble fitted = fit_slices(*_base_estimator, X, y, this->coordinator());
    _estimators.swap(fitted);
    _fitted = true;
    VLOG(1) << "fitted " << _estimators.size() << " " << _base_estimator->name() << " in " << timer.read() << "s";
    return *this;
}

torch::Tensor SearchLight::fit_transform(const torch::Tensor& X, const torch::Tensor& y) {
    return this->fit(X, y).transform(X);
}

torch::Tensor SearchLight::transform(const torch::Tensor& X) const {
    return this->apply(X, Method::kTransform);
}

torch::Tensor SearchLight::predict(const torch::Tensor& X) const {
    return this->apply(X, Method::kPredict);
}

torch::Tensor SearchLight::predict_proba(const torch::Tensor& X) const {
    return this->apply(X, Method::kPredictProba);
}

torch::Tensor SearchLight::decision_function(const torch::Tensor& X) const {
    return this->apply(X, Method::kDecisionFunction);
}

torch::Tensor SearchLight::apply(const torch::Tensor& X, Method method) const {
    this->check_Xy(X);
    this->check_fitted();
    method = resolve_method(*_base_estimator, method);
    this->check_n_slices(X);

    // split along samples: each worker reads every estimator, none holds a copy
    base::Timer timer(method_name(method));
    torch::Tensor y_pred = apply_same_slice(_estimators, X, method, this->coordinator());
    VLOG(1) << timer << " -> " << base::shape2string(y_pred.sizes());
    return y_pred;
}

torch::Tensor SearchLight::score(const torch::Tensor& X, const torch::Tensor& y) const {
    this->check_Xy(X, &y);
    this->check_fitted();
    resolve_method(*_base_estimator, Method::kScore);
    this->check_n_slices(X);

    base::Timer timer("score");
    torch::Tensor score = score_same_slice(_estimators, X, y, this->coordinator());
    VLOG(1) << timer << " -> " << base::shape2string(score.sizes());
    return score;
}

const Model& SearchLight::estimator(size_t idx) const {
    if (idx >= _estimators.size()) {
        std::ostringstream err_string;
        err_string << "estimator index " << idx << " out of range for " << _estimators.size() << " estimators";
        throw std::out_of_range(err_string.str());
    }
    return *_estimators[idx];
}

void SearchLight::check_Xy(const torch::Tensor& X, const torch::Tensor* y) const {
    if (!X.defined()) {
        throw ShapeError("X must be a defined tensor.");
    }
    if (X.dim() != 3) {
        std::ostringstream err_string;
        err_string << "X must have 3 dimensions (n_samples, n_features, n_slices), got "
                   << base::shape2string(X.sizes());
        throw ShapeError(err_string.str());
    }
    if (X.size(0) < 1 || X.size(2) < 1) {
        std::ostringstream err_string;
        err_string << "X must hold at least one sample and one slice, got " << base::shape2string(X.sizes());
        throw ShapeError(err_string.str());
    }
    if (y != nullptr) {
        if (!y->defined() || y->dim() != 1) {
            throw ShapeError("y must be a 1-d tensor.");
        }
        if (X.size(0) != y->size(0) || y->size(0) < 1) {
            throw ShapeError("X and y must have the same length.");
        }
    }
}

void SearchLight::check_fitted() const {
    if (!_fitted) {
        throw NotFittedError("This search light is not fitted yet, call fit() first.");
    }
}

void SearchLight::check_n_slices(const torch::Tensor& X) const {
    if (X.size(2) != static_cast<int64_t>(_estimators.size())) {
        std::ostringstream err_string;
        err_string << "The number of estimators (" << _estimators.size() << ") does not match X.shape[2] ("
                   << X.size(2) << ").";
        throw ShapeError(err_string.str());
    }
}

ParallelSplitCoordinator SearchLight::coordinator() const {
    return ParallelSplitCoordinator(_runner.get(), _n_workers);
}

/**
 * implementation: GeneralizationLight
 * **/
GeneralizationLight::GeneralizationLight(std::shared_ptr<const Model> base_estimator,
                                         const SearchLightOptions& options,
                                         std::shared_ptr<TaskRunner> runner)
    : SearchLight(std::move(base_estimator), options, std::move(runner)) {}

torch::Tensor GeneralizationLight::apply(const torch::Tensor& X, Method method) const {
    this->check_Xy(X);
    this->check_fitted();
    method = resolve_method(this->base_estimator(), method);

    base::Timer timer(method_name(method));
    torch::Tensor y_pred = apply_cross_slice(this->estimators(), X, method, this->coordinator());
    VLOG(1) << timer << " -> " << base::shape2string(y_pred.sizes());
    return y_pred;
}

torch::Tensor GeneralizationLight::score(const torch::Tensor& X, const torch::Tensor& y) const {
    this->check_Xy(X, &y);
    this->check_fitted();
    resolve_method(this->base_estimator(), Method::kScore);

    base::Timer timer("score");
    torch::Tensor score = score_cross_slice(this->estimators(), X, y, this->coordinator());
    VLOG(1) << timer << " -> " << base::shape2string(score.sizes());
    return score;
}

}  // namespace decoding
}  // namespace searchlight
