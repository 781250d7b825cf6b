#include "searchlight/base/thread_pool.h"

#include <glog/logging.h>

using google::protobuf::Closure;

namespace searchlight {
namespace base {

ThreadPool::ThreadPool(int worker_num) : worker_num(worker_num),
                                         _started(false),
                                         _task_queue(static_cast<size_t>(worker_num > 0 ? worker_num : 1)) {
    CHECK_GT(worker_num, 0) << "ThreadPool needs at least one worker";
    this->_workers.reserve(this->worker_num);
    for (int idx = 0; idx < this->worker_num; idx++) {
        this->_workers.push_back(new ThreadWorker(this));
    }
}

ThreadPool::~ThreadPool() {
    if (this->_started) {
        // one NULL per worker => each worker leaves its loop
        for (int idx = 0; idx < this->worker_num; idx++) {
            this->add(NULL);
        }
        for (int idx = 0; idx < this->worker_num; idx++) {
            this->_workers[idx]->join();
        }
    }
    for (int idx = 0; idx < this->worker_num; idx++) {
        delete this->_workers[idx];
    }
}

void ThreadPool::start() {
    CHECK(!this->_started) << "ThreadPool already started";
    for (int idx = 0; idx < this->worker_num; idx++) {
        this->_workers[idx]->start();
    }
    this->_started = true;
    VLOG(2) << "ThreadPool started with " << this->worker_num << " workers";
}

void ThreadPool::add(Closure* closure) {
    this->_task_queue.push(closure);
}

void ThreadWorker::run() {
    while (true) {
        Closure* closure = NULL;
        this->_thread_pool->_task_queue.pop(&closure);
        if (closure == NULL) {
            break;
        }
        closure->Run();
    }
}

}  // namespace base
}  // namespace searchlight
