#include "searchlight/base/thread_pool.h"

#include <gtest/gtest.h>
#include <atomic>
#include <vector>

#include "searchlight/base/blocking_counter.h"
#include "searchlight/base/concurrent_queue.h"
#include "searchlight/base/thread.h"

namespace searchlight {
namespace base {

namespace {

void count_hit(std::atomic<int>* hits, BlockingCounter* done) {
    (*hits)++;
    done->decrement();
}

// pushes 0 .. n-1 into a queue
class Producer : public Thread {
public:
    Producer(FixedSizeConQueue<int>* queue, int n) : Thread("Producer"),
                                                     _queue(queue),
                                                     _n(n) {}

protected:
    void run() override {
        for (int idx = 0; idx < _n; idx++) {
            _queue->push(idx);
        }
    }

private:
    FixedSizeConQueue<int>* _queue;
    int _n;
};

}  // namespace

TEST(ThreadPoolTest, runs_every_closure_once) {
    const int n_tasks = 50;
    ThreadPool pool(4);
    pool.start();
    EXPECT_EQ(pool.worker_num, 4);

    std::atomic<int> hits(0);
    BlockingCounter done(n_tasks);
    for (int idx = 0; idx < n_tasks; idx++) {
        // self-deleting after Run()
        pool.add(google::protobuf::NewCallback(&count_hit, &hits, &done));
    }
    done.wait();

    EXPECT_EQ(hits.load(), n_tasks);
}

TEST(ThreadPoolTest, destruction_without_start) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.worker_num, 2);
}

TEST(ConcurrentQueueTest, bounded_fifo_across_threads) {
    // capacity 1 => the producer blocks until each element is consumed
    FixedSizeConQueue<int> queue(1);
    Producer producer(&queue, 20);
    producer.start();

    std::vector<int> received;
    for (int idx = 0; idx < 20; idx++) {
        int value = -1;
        queue.pop(&value);
        received.push_back(value);
    }
    producer.join();

    ASSERT_EQ(received.size(), 20u);
    for (int idx = 0; idx < 20; idx++) {
        EXPECT_EQ(received[idx], idx);
    }
}

TEST(BlockingCounterTest, zero_does_not_block) {
    BlockingCounter counter(0);
    counter.wait();
    SUCCEED();
}

}  // namespace base
}  // namespace searchlight
