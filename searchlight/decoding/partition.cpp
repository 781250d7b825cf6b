#include "searchlight/decoding/partition.hpp"

#include <glog/logging.h>
#include <algorithm>
#include <sstream>

#include "searchlight/base/errors.h"
#include "searchlight/base/string_utils.h"

namespace searchlight {
namespace decoding {

std::vector<Partition> split_axis(int64_t length, int n_parts) {
    CHECK_GE(length, 0);
    CHECK_GT(n_parts, 0);

    std::vector<Partition> parts;
    const int64_t count = std::min<int64_t>(n_parts, length);
    if (count == 0) {
        return parts;
    }
    const int64_t base_size = length / count;
    const int64_t remainder = length % count;

    parts.reserve(static_cast<size_t>(count));
    int64_t cursor = 0;
    for (int64_t idx = 0; idx < count; idx++) {
        Partition part;
        part.begin = cursor;
        part.end   = cursor + base_size + (idx < remainder ? 1 : 0);
        cursor     = part.end;
        parts.push_back(part);
    }
    CHECK_EQ(cursor, length);
    return parts;
}

ParallelSplitCoordinator::ParallelSplitCoordinator(TaskRunner* runner, int n_jobs) : _runner(runner),
                                                                                     _n_jobs(n_jobs) {
    CHECK_NOTNULL(runner);
    CHECK_GT(n_jobs, 0) << "n_jobs must be resolved before partitioning";
}

std::vector<Partition> ParallelSplitCoordinator::partition(int64_t axis_length, const std::string& axis_name) const {
    std::vector<Partition> parts = split_axis(axis_length, _n_jobs);
    if (static_cast<int64_t>(parts.size()) < _n_jobs) {
        VLOG(1) << "n_jobs=" << _n_jobs << " capped to " << parts.size() << " chunks by " << axis_length << " "
                << axis_name;
    }
    VLOG(2) << "split " << axis_length << " " << axis_name << " into " << parts.size() << " chunks";
    return parts;
}

torch::Tensor ParallelSplitCoordinator::merge(const std::vector<torch::Tensor>& chunks, int64_t dim) {
    CHECK(!chunks.empty()) << "nothing to merge";
    if (chunks.size() == 1) {
        return chunks[0];
    }

    // torch::cat would promote dtypes; chunks must agree everywhere but along dim
    const torch::Tensor& first = chunks[0];
    for (size_t idx = 1; idx < chunks.size(); idx++) {
        const torch::Tensor& chunk = chunks[idx];
        bool consistent = chunk.scalar_type() == first.scalar_type() && chunk.dim() == first.dim();
        for (int64_t d = 0; consistent && d < first.dim(); d++) {
            consistent = d == dim || chunk.size(d) == first.size(d);
        }
        if (!consistent) {
            std::ostringstream err_string;
            err_string << "inconsistent model output across chunks: chunk 0 is " << base::shape2string(first.sizes())
                       << " of " << first.dtype() << ", chunk " << idx << " is " << base::shape2string(chunk.sizes())
                       << " of " << chunk.dtype() << " (merged along dim " << dim << ")";
            throw ShapeError(err_string.str());
        }
    }
    return torch::cat(chunks, dim);
}

}  // namespace decoding
}  // namespace searchlight
