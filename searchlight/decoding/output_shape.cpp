#include "searchlight/decoding/output_shape.hpp"

#include <glog/logging.h>
#include <sstream>
#include <utility>

#include "searchlight/base/errors.h"
#include "searchlight/base/string_utils.h"

namespace searchlight {
namespace decoding {

std::vector<int64_t> infer_output_shape(const torch::Tensor& unit,
                                        const std::vector<int64_t>& leading_shape,
                                        const std::vector<int64_t>& unit_prefix) {
    const int64_t prefix_rank = static_cast<int64_t>(unit_prefix.size());
    bool prefix_ok            = unit.dim() >= prefix_rank;
    for (int64_t d = 0; prefix_ok && d < prefix_rank; d++) {
        prefix_ok = unit.size(d) == unit_prefix[d];
    }
    if (!prefix_ok) {
        std::ostringstream err_string;
        err_string << "model output of shape " << base::shape2string(unit.sizes()) << " does not start with "
                   << base::shape2string(unit_prefix);
        throw ShapeError(err_string.str());
    }

    std::vector<int64_t> shape(leading_shape);
    for (int64_t d = prefix_rank; d < unit.dim(); d++) {
        shape.push_back(unit.size(d));
    }
    return shape;
}

LazyOutput::LazyOutput(std::vector<int64_t> leading_shape, std::vector<int64_t> unit_prefix)
    : _leading_shape(std::move(leading_shape)),
      _unit_prefix(std::move(unit_prefix)) {}

torch::Tensor& LazyOutput::accept(const torch::Tensor& unit) {
    if (!_output.defined()) {
        std::vector<int64_t> shape = infer_output_shape(unit, _leading_shape, _unit_prefix);
        _unit_shape                = unit.sizes().vec();
        _output                    = torch::zeros(shape, unit.options());
        VLOG(3) << "allocated output " << base::shape2string(shape) << " of " << unit.dtype();
        return _output;
    }

    if (unit.sizes().vec() != _unit_shape || unit.scalar_type() != _output.scalar_type()) {
        std::ostringstream err_string;
        err_string << "inconsistent model output: expected " << base::shape2string(_unit_shape) << " of "
                   << _output.dtype() << ", got " << base::shape2string(unit.sizes()) << " of " << unit.dtype();
        throw ShapeError(err_string.str());
    }
    return _output;
}

const torch::Tensor& LazyOutput::tensor() const {
    CHECK(_output.defined()) << "LazyOutput read before any unit was accepted";
    return _output;
}

}  // namespace decoding
}  // namespace searchlight
