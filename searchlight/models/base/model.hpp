#pragma once
#include <torch/torch.h>
#include <memory>
#include <string>

namespace searchlight {
namespace models {
namespace base {

/**
 * operations a model may offer
 * **/
enum class Method {
    kFit,
    kTransform,
    kPredict,
    kPredictProba,
    kDecisionFunction,
    kScore
};

const char* method_name(Method method);

/**
 * base class for all models
 *
 * A model offers a subset of the Method operations and reports which ones
 * through has_capability(). Operations it does not override throw
 * CapabilityError. Inference methods are const and must not touch shared
 * state: the ensembles call them concurrently from several workers.
 *
 * X is always a 2-d (samples x features) tensor, y a 1-d tensor of targets.
 * **/
class Model {
public:
    Model() {}
    virtual ~Model();

    // fresh, unfitted copy carrying the same hyper-parameters
    virtual std::unique_ptr<Model> clone() const = 0;

    virtual std::string name() const = 0;

    virtual bool has_capability(Method method) const = 0;

    virtual void fit(const torch::Tensor& X, const torch::Tensor& y);
    virtual torch::Tensor transform(const torch::Tensor& X) const;
    virtual torch::Tensor predict(const torch::Tensor& X) const;
    virtual torch::Tensor predict_proba(const torch::Tensor& X) const;
    virtual torch::Tensor decision_function(const torch::Tensor& X) const;
    virtual torch::Tensor score(const torch::Tensor& X, const torch::Tensor& y) const;

    // dispatch to one of the inference methods (transform .. decision_function)
    torch::Tensor apply(Method method, const torch::Tensor& X) const;

protected:
    [[noreturn]] void not_implemented(Method method) const;
};

/**
 * Method actually called on `model` when `method` is requested.
 * transform falls back to predict; anything else missing is a CapabilityError.
 * **/
Method resolve_method(const Model& model, Method method);

}  // namespace base
}  // namespace models
}  // namespace searchlight
