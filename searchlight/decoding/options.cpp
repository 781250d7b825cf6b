#include "searchlight/decoding/options.hpp"

#include "searchlight/base/errors.h"
#include "searchlight/base/string_utils.h"

namespace searchlight {
namespace decoding {

int parse_n_jobs(const std::string& text) {
    int n_jobs = 0;
    if (!base::string2number(text, &n_jobs)) {
        throw ConfigurationError("n_jobs must be int, got " + text);
    }
    return n_jobs;
}

SearchLightOptions parse_options(const std::map<std::string, std::string>& config) {
    SearchLightOptions options;
    for (const auto& entry : config) {
        if (entry.first == "n_jobs") {
            options.n_jobs = parse_n_jobs(entry.second);
        } else {
            throw ConfigurationError("unknown search light option: " + entry.first);
        }
    }
    validate(options);
    return options;
}

void validate(const SearchLightOptions& options) {
    if (options.n_jobs == 0) {
        throw ConfigurationError("n_jobs == 0 has no meaning, use 1 for sequential execution");
    }
}

}  // namespace decoding
}  // namespace searchlight
