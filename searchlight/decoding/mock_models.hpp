#pragma once
#include <torch/torch.h>
#include <atomic>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "searchlight/base/errors.h"
#include "searchlight/models/base/model.hpp"

namespace searchlight {
namespace decoding {
namespace mock {

using models::base::Method;
using models::base::Model;

/**
 * Deterministic, row-independent model for orchestration tests.
 *
 * fit() remembers offset = mean(X) + mean(y); every inference output is built
 * from per-row sums of two-feature inputs, so results do not depend on how
 * rows are batched. Clones share the call counters and capabilities.
 * **/
class MockModel : public Model {
public:
    struct Counters {
        std::atomic<int> fit_calls{0};
        std::atomic<int> apply_calls{0};
        std::atomic<int> score_calls{0};
    };

    explicit MockModel(std::set<Method> capabilities = all_methods(),
                       std::shared_ptr<Counters> counters = std::make_shared<Counters>())
        : _capabilities(std::move(capabilities)),
          _counters(std::move(counters)) {}

    static std::set<Method> all_methods() {
        return {Method::kFit,          Method::kTransform,        Method::kPredict,
                Method::kPredictProba, Method::kDecisionFunction, Method::kScore};
    }

    std::unique_ptr<Model> clone() const override {
        return std::unique_ptr<Model>(new MockModel(_capabilities, _counters));
    }

    std::string name() const override {
        return "MockModel";
    }

    bool has_capability(Method method) const override {
        return _capabilities.count(method) > 0;
    }

    void fit(const torch::Tensor& X, const torch::Tensor& y) override {
        _counters->fit_calls++;
        _offset = X.to(torch::kDouble).mean().item<double>() + y.to(torch::kDouble).mean().item<double>();
        _fitted = true;
    }

    torch::Tensor transform(const torch::Tensor& X) const override {
        torch::Tensor row = this->row_sum(X);
        return torch::stack({row, row * 2}, 1);
    }

    torch::Tensor predict(const torch::Tensor& X) const override {
        return this->row_sum(X);
    }

    torch::Tensor predict_proba(const torch::Tensor& X) const override {
        torch::Tensor row = this->row_sum(X);
        return torch::stack({row, row + 1, row + 2}, 1);
    }

    torch::Tensor decision_function(const torch::Tensor& X) const override {
        return -this->row_sum(X);
    }

    torch::Tensor score(const torch::Tensor& X, const torch::Tensor& y) const override {
        _counters->score_calls++;
        torch::Tensor y_pred = this->predict(X);
        return (y_pred - y.to(torch::kDouble)).abs().mean();
    }

    bool is_fitted() const {
        return _fitted;
    }
    double offset() const {
        return _offset;
    }
    const Counters& counters() const {
        return *_counters;
    }

private:
    torch::Tensor row_sum(const torch::Tensor& X) const {
        _counters->apply_calls++;
        if (!_fitted) {
            throw NotFittedError("MockModel is not fitted");
        }
        return X.to(torch::kDouble).sum(1) + _offset;
    }

    std::set<Method> _capabilities;
    std::shared_ptr<Counters> _counters;
    double _offset = 0;
    bool _fitted   = false;
};

// fails to fit any slice whose first value is negative
class FailingModel : public MockModel {
public:
    std::unique_ptr<Model> clone() const override {
        return std::unique_ptr<Model>(new FailingModel());
    }

    void fit(const torch::Tensor& X, const torch::Tensor& y) override {
        if (X[0][0].item<double>() < 0) {
            throw std::runtime_error("negative slice");
        }
        MockModel::fit(X, y);
    }
};

/**
 * Output shape or dtype depends on the slice it was fitted on (the slice
 * value itself): predict gives (n, 1 + slice), decision_function is long for
 * slice 0 and double otherwise.
 * **/
class RaggedModel : public MockModel {
public:
    std::unique_ptr<Model> clone() const override {
        return std::unique_ptr<Model>(new RaggedModel());
    }

    void fit(const torch::Tensor& X, const torch::Tensor& y) override {
        MockModel::fit(X, y);
        _slice = static_cast<int64_t>(X[0][0].item<double>());
    }

    torch::Tensor predict(const torch::Tensor& X) const override {
        return torch::ones({X.size(0), 1 + _slice}, torch::kDouble);
    }

    torch::Tensor decision_function(const torch::Tensor& X) const override {
        return torch::zeros({X.size(0)}, _slice == 0 ? torch::kLong : torch::kDouble);
    }

private:
    int64_t _slice = 0;
};

/**
 * Output depends on how many rows one call receives: odd row counts give
 * long decisions and (rows, 2) predictions, even ones double decisions and
 * (rows, 1) predictions. Consistent within a call, not across chunks.
 * **/
class RowCountModel : public MockModel {
public:
    std::unique_ptr<Model> clone() const override {
        return std::unique_ptr<Model>(new RowCountModel());
    }

    torch::Tensor predict(const torch::Tensor& X) const override {
        return torch::ones({X.size(0), 1 + X.size(0) % 2}, torch::kDouble);
    }

    torch::Tensor decision_function(const torch::Tensor& X) const override {
        return torch::zeros({X.size(0)}, X.size(0) % 2 == 1 ? torch::kLong : torch::kDouble);
    }
};

// (n, f, s) with X[a, k, j] = j + (a * f + k) / 100
inline torch::Tensor make_X(int64_t n_samples, int64_t n_features, int64_t n_slices) {
    torch::Tensor rows  = torch::arange(n_samples * n_features, torch::kDouble).reshape({n_samples, n_features, 1});
    torch::Tensor slice = torch::arange(n_slices, torch::kDouble).reshape({1, 1, n_slices});
    return rows / 100 + slice;
}

// 0, 1, 0, 1, ...
inline torch::Tensor make_y(int64_t n_samples) {
    return torch::arange(n_samples, torch::kLong).remainder(2);
}

}  // namespace mock
}  // namespace decoding
}  // namespace searchlight
