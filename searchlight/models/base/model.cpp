#include "searchlight/models/base/model.hpp"

#include <sstream>

#include "searchlight/base/errors.h"

namespace searchlight {
namespace models {
namespace base {

const char* method_name(Method method) {
    switch (method) {
        case Method::kFit:
            return "fit";
        case Method::kTransform:
            return "transform";
        case Method::kPredict:
            return "predict";
        case Method::kPredictProba:
            return "predict_proba";
        case Method::kDecisionFunction:
            return "decision_function";
        case Method::kScore:
            return "score";
    }
    return "unknown";
}

/**
 * definition of the base class for all models
 * **/
Model::~Model() {}

void Model::not_implemented(Method method) const {
    std::ostringstream err_string;
    err_string << this->name() << " does not have `" << method_name(method) << "` method.";
    throw CapabilityError(err_string.str());
}

void Model::fit(const torch::Tensor&, const torch::Tensor&) {
    not_implemented(Method::kFit);
}

torch::Tensor Model::transform(const torch::Tensor&) const {
    not_implemented(Method::kTransform);
}

torch::Tensor Model::predict(const torch::Tensor&) const {
    not_implemented(Method::kPredict);
}

torch::Tensor Model::predict_proba(const torch::Tensor&) const {
    not_implemented(Method::kPredictProba);
}

torch::Tensor Model::decision_function(const torch::Tensor&) const {
    not_implemented(Method::kDecisionFunction);
}

torch::Tensor Model::score(const torch::Tensor&, const torch::Tensor&) const {
    not_implemented(Method::kScore);
}

torch::Tensor Model::apply(Method method, const torch::Tensor& X) const {
    switch (method) {
        case Method::kTransform:
            return this->transform(X);
        case Method::kPredict:
            return this->predict(X);
        case Method::kPredictProba:
            return this->predict_proba(X);
        case Method::kDecisionFunction:
            return this->decision_function(X);
        case Method::kFit:
        case Method::kScore:
            break;
    }
    std::ostringstream err_string;
    err_string << "`" << method_name(method) << "` is not an inference method.";
    throw std::invalid_argument(err_string.str());
}

Method resolve_method(const Model& model, Method method) {
    if (method == Method::kTransform && !model.has_capability(Method::kTransform)) {
        method = Method::kPredict;
    }
    if (!model.has_capability(method)) {
        std::ostringstream err_string;
        err_string << "base_estimator " << model.name() << " does not have `" << method_name(method) << "` method.";
        throw CapabilityError(err_string.str());
    }
    return method;
}

}  // namespace base
}  // namespace models
}  // namespace searchlight
