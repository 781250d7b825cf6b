#pragma once
#include <google/protobuf/stubs/callback.h>
#include <torch/torch.h>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "searchlight/decoding/task_runner.hpp"

namespace searchlight {
namespace decoding {

/**
 * half-open index range [begin, end) along one axis
 * **/
struct Partition {
    int64_t begin = 0;
    int64_t end   = 0;

    int64_t size() const {
        return end - begin;
    }
};

/**
 * Contiguous, ordered, non-overlapping ranges covering [0, length).
 * At most min(n_parts, length) ranges are returned, never an empty one; the
 * first (length % count) ranges hold one extra element.
 * **/
std::vector<Partition> split_axis(int64_t length, int n_parts);

namespace internal {

// runs one unit of work, keeping its result or its exception in caller-owned slots
template <typename Result>
class UnitClosure : public google::protobuf::Closure {
public:
    UnitClosure(const std::function<Result()>* unit, Result* result, std::exception_ptr* error) : _unit(unit),
                                                                                                 _result(result),
                                                                                                 _error(error) {}

    void Run() override {
        try {
            *_result = (*_unit)();
        } catch (...) {
            *_error = std::current_exception();  // re-thrown by the coordinator
        }
    }

private:
    const std::function<Result()>* _unit;
    Result* _result;
    std::exception_ptr* _error;
};

}  // namespace internal

/**
 * Splits an axis into one chunk per job, hands each chunk to the task runner
 * and reassembles the chunk results in partition order.
 * **/
class ParallelSplitCoordinator {
public:
    // n_jobs must already be resolved (positive)
    ParallelSplitCoordinator(TaskRunner* runner, int n_jobs);

    std::vector<Partition> partition(int64_t axis_length, const std::string& axis_name) const;

    // results in unit order; the first failing unit (in unit order) is re-thrown
    // once every unit has finished
    template <typename Result>
    std::vector<Result> run(const std::vector<std::function<Result()>>& units) const;

    // single chunk returned as-is, otherwise concatenated along dim;
    // ShapeError when chunks differ in dtype or in any other dimension
    static torch::Tensor merge(const std::vector<torch::Tensor>& chunks, int64_t dim);

    int n_jobs() const {
        return _n_jobs;
    }

private:
    TaskRunner* _runner;
    int _n_jobs;
};

template <typename Result>
std::vector<Result> ParallelSplitCoordinator::run(const std::vector<std::function<Result()>>& units) const {
    std::vector<Result> results(units.size());
    std::vector<std::exception_ptr> errors(units.size());

    std::vector<std::unique_ptr<internal::UnitClosure<Result>>> closures;
    std::vector<google::protobuf::Closure*> tasks;
    closures.reserve(units.size());
    tasks.reserve(units.size());
    for (size_t idx = 0; idx < units.size(); idx++) {
        closures.emplace_back(new internal::UnitClosure<Result>(&units[idx], &results[idx], &errors[idx]));
        tasks.push_back(closures.back().get());
    }

    _runner->run(tasks);

    for (size_t idx = 0; idx < errors.size(); idx++) {
        if (errors[idx]) {
            std::rethrow_exception(errors[idx]);
        }
    }
    return results;
}

}  // namespace decoding
}  // namespace searchlight
