#include "searchlight/models/linear/ridge_regression.hpp"

#include <stdexcept>

#include "searchlight/base/errors.h"
#include "searchlight/models/linear/linear_utils.hpp"

namespace searchlight {
namespace models {
namespace linear {

using base::Method;
using base::Model;

RidgeRegression::RidgeRegression(double alpha) : alpha(alpha) {
    if (alpha < 0) {
        throw std::invalid_argument("RidgeRegression: alpha must be non-negative");
    }
}

RidgeRegression::~RidgeRegression() {}

std::unique_ptr<Model> RidgeRegression::clone() const {
    return std::unique_ptr<Model>(new RidgeRegression(this->alpha));
}

std::string RidgeRegression::name() const {
    return "RidgeRegression";
}

bool RidgeRegression::has_capability(Method method) const {
    return method == Method::kFit || method == Method::kPredict || method == Method::kScore;
}

void RidgeRegression::fit(const torch::Tensor& X, const torch::Tensor& y) {
    check_training_data(X, y, this->name());

    torch::Tensor Xd     = X.to(torch::kDouble);
    torch::Tensor yd     = y.to(torch::kDouble);
    torch::Tensor x_mean = Xd.mean(0);
    torch::Tensor y_mean = yd.mean();
    torch::Tensor Xc     = Xd - x_mean;
    torch::Tensor yc     = yd - y_mean;

    const int64_t n_features = Xd.size(1);
    torch::Tensor gram       = Xc.t().matmul(Xc) + torch::eye(n_features, Xd.options()) * this->alpha;
    torch::Tensor rhs        = Xc.t().matmul(yc).unsqueeze(1);
    _coef                    = torch::linalg_solve(gram, rhs).squeeze(1);
    _intercept               = (y_mean - x_mean.dot(_coef)).item<double>();
}

torch::Tensor RidgeRegression::predict(const torch::Tensor& X) const {
    if (!_coef.defined()) {
        throw NotFittedError("RidgeRegression is not fitted yet.");
    }
    check_inference_data(X, _coef.size(0), this->name());
    return X.to(torch::kDouble).matmul(_coef) + _intercept;
}

torch::Tensor RidgeRegression::score(const torch::Tensor& X, const torch::Tensor& y) const {
    torch::Tensor y_pred = this->predict(X);
    if (y.dim() != 1 || y.size(0) != y_pred.size(0)) {
        throw std::invalid_argument("RidgeRegression::score: y must be 1-d with one target per sample");
    }
    torch::Tensor yd  = y.to(torch::kDouble);
    double ss_res     = (yd - y_pred).pow(2).sum().item<double>();
    double ss_tot     = (yd - yd.mean()).pow(2).sum().item<double>();
    double r2         = 0.0;
    if (ss_tot > 0) {
        r2 = 1.0 - ss_res / ss_tot;
    } else if (ss_res == 0) {
        r2 = 1.0;
    }
    return torch::scalar_tensor(r2, torch::kDouble);
}

}  // namespace linear
}  // namespace models
}  // namespace searchlight
