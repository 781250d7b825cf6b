#include "searchlight/decoding/task_runner.hpp"

#include <glog/logging.h>
#include <unistd.h>
#include <algorithm>
#include <exception>

#include "searchlight/base/blocking_counter.h"
#include "searchlight/base/errors.h"

using google::protobuf::Closure;
using std::vector;

namespace searchlight {
namespace decoding {

namespace {

// runs one task, keeping its exception for the caller's thread
void run_task(Closure* task, std::exception_ptr* error) {
    try {
        task->Run();
    } catch (...) {
        *error = std::current_exception();  // re-thrown by rethrow_first()
    }
}

void rethrow_first(const vector<std::exception_ptr>& errors) {
    for (size_t idx = 0; idx < errors.size(); idx++) {
        if (errors[idx]) {
            std::rethrow_exception(errors[idx]);
        }
    }
}

// runs the wrapped closure then counts down, so the caller can wait on the batch
class CountingClosure : public Closure {
public:
    CountingClosure(Closure* task, std::exception_ptr* error, base::BlockingCounter* counter) : _task(task),
                                                                                                _error(error),
                                                                                                _counter(counter) {}

    void Run() override {
        run_task(_task, _error);
        _counter->decrement();
    }

private:
    Closure* _task;
    std::exception_ptr* _error;
    base::BlockingCounter* _counter;
};

}  // namespace

void SequentialRunner::run(const vector<Closure*>& tasks) {
    vector<std::exception_ptr> errors(tasks.size());
    for (size_t idx = 0; idx < tasks.size(); idx++) {
        run_task(tasks[idx], &errors[idx]);
    }
    rethrow_first(errors);
}

ThreadPoolRunner::ThreadPoolRunner(int worker_num) : _pool(worker_num) {
    _pool.start();
}

void ThreadPoolRunner::run(const vector<Closure*>& tasks) {
    base::BlockingCounter counter(static_cast<int>(tasks.size()));
    vector<std::exception_ptr> errors(tasks.size());
    vector<std::unique_ptr<CountingClosure>> wrapped;
    wrapped.reserve(tasks.size());
    for (size_t idx = 0; idx < tasks.size(); idx++) {
        wrapped.emplace_back(new CountingClosure(tasks[idx], &errors[idx], &counter));
        _pool.add(wrapped.back().get());
    }
    counter.wait();
    rethrow_first(errors);
}

int ThreadPoolRunner::worker_num() const {
    return _pool.worker_num;
}

int cpu_count() {
    long n_cpus = sysconf(_SC_NPROCESSORS_ONLN);
    return n_cpus > 0 ? static_cast<int>(n_cpus) : 1;
}

int resolve_n_jobs(int n_jobs) {
    if (n_jobs == 0) {
        throw ConfigurationError("n_jobs == 0 has no meaning, use 1 for sequential execution");
    }
    if (n_jobs > 0) {
        return n_jobs;
    }
    return std::max(cpu_count() + 1 + n_jobs, 1);
}

std::shared_ptr<TaskRunner> make_task_runner(int n_jobs) {
    int workers = resolve_n_jobs(n_jobs);
    if (workers == 1) {
        return std::make_shared<SequentialRunner>();
    }
    VLOG(1) << "n_jobs=" << n_jobs << " resolved to " << workers << " workers";
    return std::make_shared<ThreadPoolRunner>(workers);
}

}  // namespace decoding
}  // namespace searchlight
