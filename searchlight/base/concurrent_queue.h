#ifndef SEARCHLIGHT_BASE_CONCURRENT_QUEUE_H
#define SEARCHLIGHT_BASE_CONCURRENT_QUEUE_H

#include <pthread.h>
#include <cstddef>
#include <queue>

#include "searchlight/base/noncopyable.h"

namespace searchlight {
namespace base {

/**
 * Bounded FIFO shared by producers and consumers:
 * push() blocks while max_count elements are queued, pop() blocks while empty.
 * **/
template <typename Data>
class FixedSizeConQueue {
public:
    explicit FixedSizeConQueue(size_t max_count) : max_count(max_count) {
        pthread_mutex_init(&this->_mutex, NULL);
        pthread_cond_init(&this->_empty_cond, NULL);
        pthread_cond_init(&this->_full_cond, NULL);
    }

    ~FixedSizeConQueue() {
        pthread_cond_destroy(&this->_full_cond);
        pthread_cond_destroy(&this->_empty_cond);
        pthread_mutex_destroy(&this->_mutex);
    }

    void push(const Data& data) {
        pthread_mutex_lock(&this->_mutex);
        while (this->_queue.size() >= this->max_count) {
            pthread_cond_wait(&this->_full_cond, &this->_mutex);
        }
        this->_queue.push(data);
        pthread_cond_signal(&this->_empty_cond);  // wake up a blocked consumer
        pthread_mutex_unlock(&this->_mutex);
    }

    void pop(Data* data) {
        pthread_mutex_lock(&this->_mutex);
        while (this->_queue.empty()) {
            pthread_cond_wait(&this->_empty_cond, &this->_mutex);
        }
        *data = this->_queue.front();
        this->_queue.pop();
        pthread_cond_signal(&this->_full_cond);  // wake up a blocked producer
        pthread_mutex_unlock(&this->_mutex);
    }

    const size_t max_count = 0;

private:
    std::queue<Data> _queue;
    pthread_mutex_t _mutex;
    pthread_cond_t _empty_cond;
    pthread_cond_t _full_cond;

    DISALLOW_COPY_AND_ASSIGN(FixedSizeConQueue);
};

}  // namespace base
}  // namespace searchlight

#endif  // SEARCHLIGHT_BASE_CONCURRENT_QUEUE_H
