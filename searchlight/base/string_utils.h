#ifndef SEARCHLIGHT_BASE_STRING_UTILS_H
#define SEARCHLIGHT_BASE_STRING_UTILS_H

#include <sstream>
#include <string>
#include <vector>

namespace searchlight {
namespace base {

// true only when the whole of `str` (surrounding blanks aside) parses as T
template <typename T>
bool string2number(const std::string& str, T* value) {
    std::istringstream ss(str);
    T parsed;
    if (!(ss >> parsed)) {
        return false;
    }
    ss >> std::ws;
    if (!ss.eof()) {
        return false;
    }
    *value = parsed;
    return true;
}

// "(2, 3, 4)"
template <typename Container>
std::string shape2string(const Container& shape) {
    std::ostringstream stream;
    stream << '(';
    bool first = true;
    for (const auto& dim : shape) {
        if (!first) {
            stream << ", ";
        }
        stream << dim;
        first = false;
    }
    stream << ')';
    return stream.str();
}

}  // namespace base
}  // namespace searchlight

#endif  // SEARCHLIGHT_BASE_STRING_UTILS_H
