#include "searchlight/models/linear/logistic_regression.hpp"

#include <sstream>
#include <stdexcept>
#include <tuple>

#include "searchlight/base/errors.h"
#include "searchlight/models/linear/linear_utils.hpp"

namespace searchlight {
namespace models {
namespace linear {

using base::Method;
using base::Model;

LogisticRegression::LogisticRegression(double C, int max_iter, double learning_rate) : C(C),
                                                                                       max_iter(max_iter),
                                                                                       learning_rate(learning_rate) {
    if (C <= 0) {
        throw std::invalid_argument("LogisticRegression: C must be positive");
    }
    if (max_iter < 1) {
        throw std::invalid_argument("LogisticRegression: max_iter must be at least 1");
    }
}

LogisticRegression::~LogisticRegression() {}

std::unique_ptr<Model> LogisticRegression::clone() const {
    return std::unique_ptr<Model>(new LogisticRegression(this->C, this->max_iter, this->learning_rate));
}

std::string LogisticRegression::name() const {
    return "LogisticRegression";
}

bool LogisticRegression::has_capability(Method method) const {
    return method != Method::kTransform;
}

void LogisticRegression::fit(const torch::Tensor& X, const torch::Tensor& y) {
    check_training_data(X, y, this->name());

    torch::Tensor classes = std::get<0>(torch::unique_dim(y, 0, /*sorted=*/true));
    if (classes.size(0) < 2) {
        std::ostringstream err_string;
        err_string << "LogisticRegression needs samples of at least 2 classes, got " << classes.size(0);
        throw std::invalid_argument(err_string.str());
    }

    torch::Tensor Xd = X.to(torch::kDouble);
    torch::Tensor mean;
    torch::Tensor scale;
    standardisation(Xd, &mean, &scale);
    torch::Tensor Z = (Xd - mean) / scale;

    const int64_t n_samples  = Z.size(0);
    const int64_t n_features = Z.size(1);
    const int64_t n_classes  = classes.size(0);

    // one-hot targets, (n_samples, n_classes)
    torch::Tensor Y = y.unsqueeze(1).eq(classes.unsqueeze(0)).to(torch::kDouble);

    torch::Tensor W = torch::zeros({n_features, n_classes}, Z.options());
    torch::Tensor b = torch::zeros({n_classes}, Z.options());
    const double l2 = 1.0 / (this->C * n_samples);
    for (int iter = 0; iter < this->max_iter; iter++) {
        torch::Tensor P = torch::softmax(Z.matmul(W) + b, 1);
        torch::Tensor G = P - Y;
        torch::Tensor grad_W = Z.t().matmul(G) / static_cast<double>(n_samples) + W * l2;
        torch::Tensor grad_b = G.mean(0);
        W = W - grad_W * this->learning_rate;
        b = b - grad_b * this->learning_rate;
    }

    _classes   = classes;
    _coef      = W;
    _intercept = b;
    _mean      = mean;
    _scale     = scale;
}

torch::Tensor LogisticRegression::logits(const torch::Tensor& X) const {
    if (!_coef.defined()) {
        throw NotFittedError("LogisticRegression is not fitted yet.");
    }
    check_inference_data(X, _coef.size(0), this->name());
    torch::Tensor Z = (X.to(torch::kDouble) - _mean) / _scale;
    return Z.matmul(_coef) + _intercept;
}

torch::Tensor LogisticRegression::predict(const torch::Tensor& X) const {
    torch::Tensor best = this->logits(X).argmax(1);
    return _classes.index_select(0, best);
}

torch::Tensor LogisticRegression::predict_proba(const torch::Tensor& X) const {
    return torch::softmax(this->logits(X), 1);
}

torch::Tensor LogisticRegression::decision_function(const torch::Tensor& X) const {
    torch::Tensor z = this->logits(X);
    if (z.size(1) == 2) {
        // binary => signed distance towards the second class
        return z.select(1, 1) - z.select(1, 0);
    }
    return z;
}

torch::Tensor LogisticRegression::score(const torch::Tensor& X, const torch::Tensor& y) const {
    torch::Tensor y_pred = this->predict(X);
    if (y.dim() != 1 || y.size(0) != y_pred.size(0)) {
        throw std::invalid_argument("LogisticRegression::score: y must be 1-d with one label per sample");
    }
    return y_pred.eq(y).to(torch::kDouble).mean();
}

}  // namespace linear
}  // namespace models
}  // namespace searchlight
