#pragma once
#include <torch/torch.h>
#include <cstdint>
#include <vector>

namespace searchlight {
namespace decoding {

/**
 * Output tensor of an apply / score chunk, allocated from its first unit.
 *
 * Model outputs may be scalars, vectors or higher-rank arrays, so the full
 * shape is only known once the first unit has been computed. The first unit
 * result must start with `unit_prefix` (the dimensions the orchestration
 * already knows, e.g. the number of samples); the output is then
 * zero-allocated as `leading_shape + unit.shape[len(unit_prefix):]` with the
 * dtype and device of that unit.
 *
 * Every later unit must repeat the first unit's shape and dtype exactly,
 * otherwise ShapeError.
 * **/
class LazyOutput {
public:
    LazyOutput(std::vector<int64_t> leading_shape, std::vector<int64_t> unit_prefix);

    // allocates on the first call, checks consistency afterwards
    torch::Tensor& accept(const torch::Tensor& unit);

    bool allocated() const {
        return _output.defined();
    }

    const torch::Tensor& tensor() const;

private:
    std::vector<int64_t> _leading_shape;
    std::vector<int64_t> _unit_prefix;
    std::vector<int64_t> _unit_shape;
    torch::Tensor _output;
};

// leading_shape + unit.shape[len(unit_prefix):], ShapeError when unit does not start with unit_prefix
std::vector<int64_t> infer_output_shape(const torch::Tensor& unit,
                                        const std::vector<int64_t>& leading_shape,
                                        const std::vector<int64_t>& unit_prefix);

}  // namespace decoding
}  // namespace searchlight
