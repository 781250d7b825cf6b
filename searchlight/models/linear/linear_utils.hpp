#pragma once
#include <torch/torch.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace searchlight {
namespace models {
namespace linear {

inline void check_training_data(const torch::Tensor& X, const torch::Tensor& y, const std::string& model) {
    if (!X.defined() || !y.defined()) {
        throw std::invalid_argument(model + ": X and y must be defined tensors");
    }
    if (X.dim() != 2 || y.dim() != 1) {
        throw std::invalid_argument(model + ": expected 2-d X and 1-d y");
    }
    if (X.size(0) != y.size(0) || X.size(0) == 0) {
        std::ostringstream err_string;
        err_string << model << ": X has " << X.size(0) << " samples but y has " << y.size(0);
        throw std::invalid_argument(err_string.str());
    }
}

inline void check_inference_data(const torch::Tensor& X, int64_t n_features, const std::string& model) {
    if (!X.defined() || X.dim() != 2 || X.size(1) != n_features) {
        std::ostringstream err_string;
        err_string << model << ": expected 2-d X with " << n_features << " features";
        throw std::invalid_argument(err_string.str());
    }
}

// column mean and population std; constant columns get a unit scale
inline void standardisation(const torch::Tensor& X, torch::Tensor* mean, torch::Tensor* scale) {
    *mean             = X.mean(0);
    torch::Tensor var = (X - *mean).pow(2).mean(0);
    torch::Tensor std = var.sqrt();
    *scale            = torch::where(std > 0, std, torch::ones_like(std));
}

}  // namespace linear
}  // namespace models
}  // namespace searchlight
