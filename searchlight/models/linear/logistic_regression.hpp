#pragma once
#include <torch/torch.h>
#include <memory>
#include <string>

#include "searchlight/models/base/model.hpp"

namespace searchlight {
namespace models {
namespace linear {

/**
 * Multinomial logistic regression, full-batch gradient descent on
 * standardised features with an L2 penalty of 1 / C.
 *
 * Training is deterministic: the same (X, y) always gives the same weights.
 * Class labels are the distinct values of y, kept sorted.
 * **/
class LogisticRegression : public base::Model {
public:
    explicit LogisticRegression(double C = 1.0, int max_iter = 300, double learning_rate = 0.5);
    ~LogisticRegression();

    std::unique_ptr<base::Model> clone() const override;
    std::string name() const override;
    bool has_capability(base::Method method) const override;

    void fit(const torch::Tensor& X, const torch::Tensor& y) override;
    torch::Tensor predict(const torch::Tensor& X) const override;
    torch::Tensor predict_proba(const torch::Tensor& X) const override;
    torch::Tensor decision_function(const torch::Tensor& X) const override;
    torch::Tensor score(const torch::Tensor& X, const torch::Tensor& y) const override;

    const torch::Tensor& classes() const {
        return _classes;
    }
    const torch::Tensor& coef() const {
        return _coef;
    }

    const double C             = 1.0;
    const int max_iter         = 300;
    const double learning_rate = 0.5;

private:
    torch::Tensor logits(const torch::Tensor& X) const;

    torch::Tensor _classes;    // (n_classes,), dtype of y
    torch::Tensor _coef;       // (n_features, n_classes)
    torch::Tensor _intercept;  // (n_classes,)
    torch::Tensor _mean;       // (n_features,)
    torch::Tensor _scale;      // (n_features,)
};

}  // namespace linear
}  // namespace models
}  // namespace searchlight
