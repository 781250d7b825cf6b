#ifndef SEARCHLIGHT_BASE_THREAD_POOL_H
#define SEARCHLIGHT_BASE_THREAD_POOL_H

#include <google/protobuf/stubs/callback.h>
#include <vector>

#include "searchlight/base/concurrent_queue.h"
#include "searchlight/base/noncopyable.h"
#include "searchlight/base/thread.h"

namespace searchlight {
namespace base {

class ThreadWorker;

/**
 * Fixed set of workers pulling closures from a bounded queue.
 * A closure is run exactly once by one worker; the pool never deletes it.
 * **/
class ThreadPool {
public:
    explicit ThreadPool(int worker_num);
    ~ThreadPool();

    void start();

    void add(google::protobuf::Closure* closure);

    const int worker_num = 0;

private:
    bool _started = false;
    std::vector<ThreadWorker*> _workers;
    FixedSizeConQueue<google::protobuf::Closure*> _task_queue;

    DISALLOW_COPY_AND_ASSIGN(ThreadPool);
    friend class ThreadWorker;
};

class ThreadWorker : public Thread {
public:
    explicit ThreadWorker(ThreadPool* thread_pool) : Thread("ThreadWorker"),
                                                     _thread_pool(thread_pool) {}
    virtual ~ThreadWorker() {}

protected:
    void run() override;

private:
    ThreadPool* _thread_pool;

    DISALLOW_COPY_AND_ASSIGN(ThreadWorker);
};

}  // namespace base
}  // namespace searchlight

#endif  // SEARCHLIGHT_BASE_THREAD_POOL_H
