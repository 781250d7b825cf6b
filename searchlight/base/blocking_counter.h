#ifndef SEARCHLIGHT_BASE_BLOCKING_COUNTER_H
#define SEARCHLIGHT_BASE_BLOCKING_COUNTER_H

#include <glog/logging.h>
#include <pthread.h>

#include "searchlight/base/noncopyable.h"

namespace searchlight {
namespace base {

/**
 * Counts down from an initial value; wait() returns once it reaches zero.
 * **/
class BlockingCounter {
public:
    explicit BlockingCounter(int count) : _count(count) {
        CHECK_GE(count, 0);
        pthread_mutex_init(&this->_mutex, NULL);
        pthread_cond_init(&this->_zero_cond, NULL);
    }

    ~BlockingCounter() {
        pthread_cond_destroy(&this->_zero_cond);
        pthread_mutex_destroy(&this->_mutex);
    }

    void decrement() {
        pthread_mutex_lock(&this->_mutex);
        CHECK_GT(this->_count, 0) << "BlockingCounter decremented below zero";
        if (--this->_count == 0) {
            pthread_cond_broadcast(&this->_zero_cond);
        }
        pthread_mutex_unlock(&this->_mutex);
    }

    void wait() {
        pthread_mutex_lock(&this->_mutex);
        while (this->_count > 0) {
            pthread_cond_wait(&this->_zero_cond, &this->_mutex);
        }
        pthread_mutex_unlock(&this->_mutex);
    }

private:
    int _count;
    pthread_mutex_t _mutex;
    pthread_cond_t _zero_cond;

    DISALLOW_COPY_AND_ASSIGN(BlockingCounter);
};

}  // namespace base
}  // namespace searchlight

#endif  // SEARCHLIGHT_BASE_BLOCKING_COUNTER_H
