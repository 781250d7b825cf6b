#pragma once
#include <torch/torch.h>
#include <memory>
#include <string>

#include "searchlight/models/base/model.hpp"

namespace searchlight {
namespace models {
namespace linear {

/**
 * Ridge regression with intercept, solved in closed form.
 * Offers fit / predict / score (coefficient of determination) only.
 * **/
class RidgeRegression : public base::Model {
public:
    explicit RidgeRegression(double alpha = 1.0);
    ~RidgeRegression();

    std::unique_ptr<base::Model> clone() const override;
    std::string name() const override;
    bool has_capability(base::Method method) const override;

    void fit(const torch::Tensor& X, const torch::Tensor& y) override;
    torch::Tensor predict(const torch::Tensor& X) const override;
    torch::Tensor score(const torch::Tensor& X, const torch::Tensor& y) const override;

    const torch::Tensor& coef() const {
        return _coef;
    }

    const double alpha = 1.0;

private:
    torch::Tensor _coef;  // (n_features,)
    double _intercept = 0;
};

}  // namespace linear
}  // namespace models
}  // namespace searchlight
