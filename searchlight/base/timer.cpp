#include "searchlight/base/timer.h"

namespace searchlight {
namespace base {

Timer::Timer(const std::string& name) : _name(name) {
    start();
}

void Timer::start() {
    _start_time = std::chrono::steady_clock::now();
}

double Timer::read() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - _start_time;
    return elapsed.count();
}

std::ostream& operator<<(std::ostream& out, const Timer& timer) {
    return out << timer._name << " " << timer.read() << "s";
}

}  // namespace base
}  // namespace searchlight
