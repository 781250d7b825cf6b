#include "searchlight/decoding/options.hpp"

#include <gtest/gtest.h>

#include "searchlight/base/errors.h"

namespace searchlight {
namespace decoding {

TEST(OptionsTest, parse_n_jobs) {
    EXPECT_EQ(parse_n_jobs("4"), 4);
    EXPECT_EQ(parse_n_jobs("-1"), -1);
    EXPECT_EQ(parse_n_jobs(" 2 "), 2);

    EXPECT_THROW(parse_n_jobs(""), ConfigurationError);
    EXPECT_THROW(parse_n_jobs("two"), ConfigurationError);
    EXPECT_THROW(parse_n_jobs("2.5"), ConfigurationError);
    EXPECT_THROW(parse_n_jobs("3 jobs"), ConfigurationError);
}

TEST(OptionsTest, parse_options) {
    EXPECT_EQ(parse_options({}).n_jobs, 1);
    EXPECT_EQ(parse_options({{"n_jobs", "3"}}).n_jobs, 3);
    EXPECT_EQ(parse_options({{"n_jobs", "-2"}}).n_jobs, -2);

    EXPECT_THROW(parse_options({{"n_jobs", "0"}}), ConfigurationError);
    EXPECT_THROW(parse_options({{"n_jobs", "all"}}), ConfigurationError);
    EXPECT_THROW(parse_options({{"verbose", "1"}}), ConfigurationError);
}

TEST(OptionsTest, validate) {
    SearchLightOptions options;
    EXPECT_NO_THROW(validate(options));
    options.n_jobs = -1;
    EXPECT_NO_THROW(validate(options));
    options.n_jobs = 0;
    EXPECT_THROW(validate(options), ConfigurationError);

    // configuration errors are invalid arguments
    EXPECT_THROW(validate(options), std::invalid_argument);
}

}  // namespace decoding
}  // namespace searchlight
