#pragma once
#include <map>
#include <string>

namespace searchlight {
namespace decoding {

struct SearchLightOptions {
    // number of parallel jobs for fit and apply; negative => all CPUs + 1 + n_jobs
    int n_jobs = 1;
};

// whole-string base-10 integer, else ConfigurationError
int parse_n_jobs(const std::string& text);

// recognised keys: "n_jobs"
SearchLightOptions parse_options(const std::map<std::string, std::string>& config);

// throws ConfigurationError on n_jobs == 0
void validate(const SearchLightOptions& options);

}  // namespace decoding
}  // namespace searchlight
