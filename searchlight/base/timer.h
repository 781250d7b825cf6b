#ifndef SEARCHLIGHT_BASE_TIMER_H
#define SEARCHLIGHT_BASE_TIMER_H

#include <chrono>
#include <iostream>
#include <string>

namespace searchlight {
namespace base {

// wall-clock stopwatch, started on construction
class Timer {
public:
    explicit Timer(const std::string& name = "");

    void start();

    // seconds since the last start()
    double read() const;

    const std::string& name() const {
        return _name;
    }

    friend std::ostream& operator<<(std::ostream& out, const Timer& timer);

private:
    std::chrono::steady_clock::time_point _start_time;
    std::string _name;
};

}  // namespace base
}  // namespace searchlight

#endif  // SEARCHLIGHT_BASE_TIMER_H
