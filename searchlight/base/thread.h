#ifndef SEARCHLIGHT_BASE_THREAD_H
#define SEARCHLIGHT_BASE_THREAD_H

#include <pthread.h>
#include <string>

#include "searchlight/base/noncopyable.h"

namespace searchlight {
namespace base {

// joinable pthread running the derived class's run()
class Thread {
public:
    explicit Thread(const std::string& name = "Thread");
    virtual ~Thread() {}

    void start();
    void join();

    const std::string thread_name;

protected:
    virtual void run() = 0;  // pure virtual => abstract class
    static void* thread_runner(void* arg);

    pthread_t _tid;
    bool _started;

private:
    DISALLOW_COPY_AND_ASSIGN(Thread);
};

}  // namespace base
}  // namespace searchlight

#endif  // SEARCHLIGHT_BASE_THREAD_H
