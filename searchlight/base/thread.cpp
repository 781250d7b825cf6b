#include "searchlight/base/thread.h"

#include <glog/logging.h>

namespace searchlight {
namespace base {

Thread::Thread(const std::string& name) : thread_name(name),
                                          _tid(0),
                                          _started(false) {}

void Thread::start() {
    CHECK(!this->_started) << "Thread " << this->thread_name << " already started";

    // pass in the object itself => derived class runs its own run() in the new thread
    int result = pthread_create(&(this->_tid), NULL, &Thread::thread_runner, reinterpret_cast<void*>(this));
    CHECK_EQ(result, 0) << "Could not create thread (" << result << ")";
    this->_started = true;
}

void Thread::join() {
    CHECK(this->_started) << "Thread " << this->thread_name << " was never started";
    int result = pthread_join(this->_tid, NULL);
    CHECK_EQ(result, 0) << "Could not join thread (" << this->_tid << ", " << this->thread_name << ")";
    this->_tid     = 0;
    this->_started = false;
}

void* Thread::thread_runner(void* arg) {
    // inside the new thread now
    Thread* t = reinterpret_cast<Thread*>(arg);
    t->run();
    return NULL;
}

}  // namespace base
}  // namespace searchlight
