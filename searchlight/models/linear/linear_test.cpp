#include <gtest/gtest.h>
#include <torch/torch.h>
#include <memory>

#include "searchlight/base/errors.h"
#include "searchlight/models/base/model.hpp"
#include "searchlight/models/linear/logistic_regression.hpp"
#include "searchlight/models/linear/ridge_regression.hpp"

namespace searchlight {
namespace models {
namespace linear {

using base::Method;

namespace {

// two clusters split along the first feature, class 0 then class 1
void two_clusters(torch::Tensor* X, torch::Tensor* y) {
    const int64_t n = 20;
    torch::Tensor noise = torch::linspace(-1, 1, n, torch::kDouble);
    torch::Tensor X0    = torch::stack({torch::linspace(-4, -2, n, torch::kDouble), noise}, 1);
    torch::Tensor X1    = torch::stack({torch::linspace(2, 4, n, torch::kDouble), noise.flip(0)}, 1);
    *X = torch::cat({X0, X1}, 0);
    *y = torch::cat({torch::zeros({n}, torch::kLong), torch::ones({n}, torch::kLong)}, 0);
}

}  // namespace

TEST(LogisticRegressionTest, separable_binary) {
    torch::Tensor X;
    torch::Tensor y;
    two_clusters(&X, &y);

    LogisticRegression clf;
    clf.fit(X, y);
    EXPECT_TRUE(clf.classes().equal(torch::tensor({0, 1}, torch::kLong)));

    torch::Tensor y_pred = clf.predict(X);
    EXPECT_EQ(y_pred.sizes(), torch::IntArrayRef({40}));
    EXPECT_EQ(y_pred.scalar_type(), torch::kLong);
    EXPECT_TRUE(y_pred.equal(y));
    EXPECT_DOUBLE_EQ(clf.score(X, y).item<double>(), 1.0);

    torch::Tensor proba = clf.predict_proba(X);
    EXPECT_EQ(proba.sizes(), torch::IntArrayRef({40, 2}));
    EXPECT_TRUE(proba.sum(1).allclose(torch::ones({40}, torch::kDouble)));

    // binary => one signed value per sample, positive towards class 1
    torch::Tensor decision = clf.decision_function(X);
    EXPECT_EQ(decision.sizes(), torch::IntArrayRef({40}));
    EXPECT_TRUE(decision.gt(0).to(torch::kLong).equal(y));
}

TEST(LogisticRegressionTest, multiclass_decision_function) {
    torch::Tensor X = torch::linspace(0, 8, 9, torch::kDouble).unsqueeze(1);
    torch::Tensor y = torch::tensor({5, 5, 5, -1, -1, -1, 9, 9, 9}, torch::kLong);

    LogisticRegression clf;
    clf.fit(X, y);
    // distinct labels, sorted, in the target dtype
    EXPECT_TRUE(clf.classes().equal(torch::tensor({-1, 5, 9}, torch::kLong)));
    torch::Tensor y_pred = clf.predict(X);
    EXPECT_TRUE(y_pred.eq(-1).logical_or(y_pred.eq(5)).logical_or(y_pred.eq(9)).all().item<bool>());
    EXPECT_EQ(clf.decision_function(X).sizes(), torch::IntArrayRef({9, 3}));
    EXPECT_EQ(clf.predict_proba(X).sizes(), torch::IntArrayRef({9, 3}));
    EXPECT_EQ(clf.predict(X).sizes(), torch::IntArrayRef({9}));
}

TEST(LogisticRegressionTest, errors) {
    LogisticRegression clf;
    torch::Tensor X = torch::ones({4, 2}, torch::kDouble);
    EXPECT_THROW(clf.predict(X), NotFittedError);
    EXPECT_THROW(clf.fit(X, torch::zeros({4}, torch::kLong)), std::invalid_argument);
    EXPECT_THROW(clf.fit(X, torch::zeros({3}, torch::kLong)), std::invalid_argument);
    EXPECT_THROW(clf.transform(X), CapabilityError);
    EXPECT_THROW(LogisticRegression(0.0), std::invalid_argument);

    torch::Tensor X_fit;
    torch::Tensor y_fit;
    two_clusters(&X_fit, &y_fit);
    clf.fit(X_fit, y_fit);
    EXPECT_THROW(clf.predict(torch::ones({4, 3}, torch::kDouble)), std::invalid_argument);
}

TEST(RidgeRegressionTest, exact_linear_target) {
    torch::Tensor x = torch::linspace(0, 1, 10, torch::kDouble);
    torch::Tensor X = torch::stack({x, x * x}, 1);
    torch::Tensor y = x * 2 - x * x + 3;

    RidgeRegression reg(0.0);
    reg.fit(X, y);
    EXPECT_TRUE(reg.coef().allclose(torch::tensor({2.0, -1.0}, torch::kDouble), 1e-6, 1e-6));
    EXPECT_TRUE(reg.predict(X).allclose(y, 1e-6, 1e-6));

    torch::Tensor r2 = reg.score(X, y);
    EXPECT_EQ(r2.dim(), 0);
    EXPECT_NEAR(r2.item<double>(), 1.0, 1e-9);
}

TEST(RidgeRegressionTest, penalty_shrinks_coefficients) {
    torch::Tensor x = torch::linspace(-1, 1, 21, torch::kDouble);
    torch::Tensor X = x.unsqueeze(1);
    torch::Tensor y = x * 4;

    RidgeRegression loose(0.0);
    RidgeRegression tight(100.0);
    loose.fit(X, y);
    tight.fit(X, y);
    EXPECT_LT(tight.coef().abs().item<double>(), loose.coef().abs().item<double>());
    EXPECT_LT(tight.score(X, y).item<double>(), 1.0);
}

TEST(ModelTest, capabilities) {
    LogisticRegression clf;
    RidgeRegression reg;

    EXPECT_EQ(base::resolve_method(clf, Method::kTransform), Method::kPredict);
    EXPECT_EQ(base::resolve_method(clf, Method::kPredictProba), Method::kPredictProba);
    EXPECT_EQ(base::resolve_method(reg, Method::kTransform), Method::kPredict);
    EXPECT_THROW(base::resolve_method(reg, Method::kPredictProba), CapabilityError);
    EXPECT_THROW(base::resolve_method(reg, Method::kDecisionFunction), CapabilityError);
    EXPECT_THROW(reg.predict_proba(torch::ones({2, 1})), CapabilityError);

    EXPECT_STREQ(base::method_name(Method::kDecisionFunction), "decision_function");
    EXPECT_THROW(clf.apply(Method::kScore, torch::ones({2, 1})), std::invalid_argument);
}

TEST(ModelTest, clone_keeps_hyper_parameters_not_state) {
    std::unique_ptr<base::Model> model(new RidgeRegression(2.5));
    torch::Tensor X = torch::linspace(0, 1, 5, torch::kDouble).unsqueeze(1);
    model->fit(X, X.squeeze(1));

    std::unique_ptr<base::Model> copy = model->clone();
    EXPECT_EQ(copy->name(), "RidgeRegression");
    EXPECT_DOUBLE_EQ(dynamic_cast<const RidgeRegression&>(*copy).alpha, 2.5);
    EXPECT_THROW(copy->predict(X), NotFittedError);
    EXPECT_NO_THROW(model->predict(X));

    LogisticRegression clf(0.5, 20, 0.1);
    std::unique_ptr<base::Model> clf_copy = clf.clone();
    const LogisticRegression& typed = dynamic_cast<const LogisticRegression&>(*clf_copy);
    EXPECT_DOUBLE_EQ(typed.C, 0.5);
    EXPECT_EQ(typed.max_iter, 20);
    EXPECT_DOUBLE_EQ(typed.learning_rate, 0.1);
}

}  // namespace linear
}  // namespace models
}  // namespace searchlight
