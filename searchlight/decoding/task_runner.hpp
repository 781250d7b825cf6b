#pragma once
#include <google/protobuf/stubs/callback.h>
#include <memory>
#include <vector>

#include "searchlight/base/noncopyable.h"
#include "searchlight/base/thread_pool.h"

namespace searchlight {
namespace decoding {

/**
 * Runs a batch of closures and returns once all of them have run.
 * Closures are not deleted by the runner. When closures throw, the whole batch
 * still runs and the exception of the first failing closure (in batch order)
 * is re-thrown by run().
 * **/
class TaskRunner {
public:
    TaskRunner() {}
    virtual ~TaskRunner() {}

    virtual void run(const std::vector<google::protobuf::Closure*>& tasks) = 0;
    virtual int worker_num() const = 0;

private:
    DISALLOW_COPY_AND_ASSIGN(TaskRunner);
};

// runs every closure inline, in order
class SequentialRunner : public TaskRunner {
public:
    void run(const std::vector<google::protobuf::Closure*>& tasks) override;
    int worker_num() const override {
        return 1;
    }
};

// dispatches closures to a pthread worker pool and blocks until the batch is done
class ThreadPoolRunner : public TaskRunner {
public:
    explicit ThreadPoolRunner(int worker_num);

    void run(const std::vector<google::protobuf::Closure*>& tasks) override;
    int worker_num() const override;

private:
    base::ThreadPool _pool;
};

// number of CPUs seen by the process, at least 1
int cpu_count();

// n_jobs > 0 => n_jobs; n_jobs < 0 => max(cpu_count() + 1 + n_jobs, 1); 0 => ConfigurationError
int resolve_n_jobs(int n_jobs);

// SequentialRunner when resolve_n_jobs(n_jobs) == 1, else ThreadPoolRunner
std::shared_ptr<TaskRunner> make_task_runner(int n_jobs);

}  // namespace decoding
}  // namespace searchlight
