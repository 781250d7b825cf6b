#include "searchlight/decoding/output_shape.hpp"

#include <gtest/gtest.h>

#include "searchlight/base/errors.h"

namespace searchlight {
namespace decoding {

TEST(OutputShapeTest, infer_output_shape) {
    EXPECT_EQ(infer_output_shape(torch::zeros({5}), {5, 3}, {5}), std::vector<int64_t>({5, 3}));
    EXPECT_EQ(infer_output_shape(torch::zeros({5, 4}), {5, 3}, {5}), std::vector<int64_t>({5, 3, 4}));
    EXPECT_EQ(infer_output_shape(torch::zeros({5, 2, 4}), {5, 3, 2}, {5, 2}), std::vector<int64_t>({5, 3, 2, 4}));
    // scalar scores
    EXPECT_EQ(infer_output_shape(torch::scalar_tensor(0.5), {3}, {}), std::vector<int64_t>({3}));

    EXPECT_THROW(infer_output_shape(torch::zeros({4}), {5, 3}, {5}), ShapeError);
    EXPECT_THROW(infer_output_shape(torch::scalar_tensor(0.5), {5, 3}, {5}), ShapeError);
}

TEST(OutputShapeTest, allocates_from_first_unit) {
    LazyOutput output({4, 2}, {4});
    EXPECT_FALSE(output.allocated());

    torch::Tensor unit = torch::tensor({1, 2, 3, 4}, torch::kLong);
    output.accept(unit).select(1, 0).copy_(unit);
    ASSERT_TRUE(output.allocated());
    // integer results keep an integer output
    EXPECT_EQ(output.tensor().scalar_type(), torch::kLong);
    EXPECT_EQ(output.tensor().sizes(), torch::IntArrayRef({4, 2}));
    EXPECT_TRUE(output.tensor().select(1, 1).equal(torch::zeros({4}, torch::kLong)));

    output.accept(unit * 2).select(1, 1).copy_(unit * 2);
    EXPECT_TRUE(output.tensor().select(1, 1).equal(unit * 2));
}

TEST(OutputShapeTest, rejects_inconsistent_units) {
    LazyOutput output({4, 3}, {4});
    output.accept(torch::zeros({4, 2}));
    EXPECT_THROW(output.accept(torch::zeros({4, 3})), ShapeError);
    EXPECT_THROW(output.accept(torch::zeros({4})), ShapeError);
    EXPECT_THROW(output.accept(torch::zeros({4, 2}, torch::kLong)), ShapeError);
    EXPECT_NO_THROW(output.accept(torch::ones({4, 2})));
}

}  // namespace decoding
}  // namespace searchlight
