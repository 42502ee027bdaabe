#include <gtest/gtest.h>
#include <nhs_number/schema/testable.hpp>

#include <random>
#include <set>
#include <thread>
#include <vector>

TEST(testable, bounds_are_the_reserved_range) {
  EXPECT_EQ(nhs_number::schema::to_string(nhs_number::schema::kTestableMin),
            "999 000 0000");
  EXPECT_EQ(nhs_number::schema::to_string(nhs_number::schema::kTestableMax),
            "999 999 9999");
  static_assert(nhs_number::schema::kTestableMin <
                nhs_number::schema::kTestableMax);
}

TEST(testable, range_membership_is_inclusive) {
  EXPECT_TRUE(nhs_number::schema::is_testable(nhs_number::schema::kTestableMin));
  EXPECT_TRUE(nhs_number::schema::is_testable(nhs_number::schema::kTestableMax));
  EXPECT_TRUE(nhs_number::schema::is_testable(nhs_number::schema::nhs_number_t{
      .digits = {9, 9, 9, 0, 1, 2, 3, 4, 5, 6}}));
  EXPECT_FALSE(nhs_number::schema::is_testable(nhs_number::schema::nhs_number_t{
      .digits = {9, 9, 8, 9, 9, 9, 9, 9, 9, 9}}));
  EXPECT_FALSE(nhs_number::schema::is_testable(nhs_number::schema::nhs_number_t{
      .digits = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}}));
}

TEST(testable, random_sample_stays_in_range) {
  for (int i = 0; i < 1000; ++i) {
    auto sample = nhs_number::schema::testable_random_sample();
    EXPECT_GE(sample, nhs_number::schema::kTestableMin);
    EXPECT_LE(sample, nhs_number::schema::kTestableMax);
    EXPECT_EQ(sample.digits[0], 9);
    EXPECT_EQ(sample.digits[1], 9);
    EXPECT_EQ(sample.digits[2], 9);
    for (auto digit : sample.digits) {
      EXPECT_GE(digit, 0);
      EXPECT_LE(digit, 9);
    }
  }
}

TEST(testable, member_sample_stays_in_range) {
  auto sample = nhs_number::schema::nhs_number_t::testable_random_sample();
  EXPECT_TRUE(nhs_number::schema::is_testable(sample));
}

TEST(testable, seeded_generator_is_reproducible) {
  auto first = std::mt19937{42};
  auto second = std::mt19937{42};
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(nhs_number::schema::testable_random_sample(first),
              nhs_number::schema::testable_random_sample(second));
  }
}

TEST(testable, free_digits_cover_the_full_domain) {
  auto generator = std::mt19937{7};
  auto seen = std::set<int>{};
  for (int i = 0; i < 200; ++i) {
    auto sample = nhs_number::schema::testable_random_sample(generator);
    for (std::size_t d = nhs_number::schema::kTestablePrefixLength;
         d < nhs_number::schema::kDigitCount; ++d) {
      seen.insert(sample.digits[d]);
    }
  }
  EXPECT_EQ(seen.size(), 10u);
}

TEST(testable, concurrent_sampling_stays_in_range) {
  auto threads = std::vector<std::thread>{};
  auto results = std::vector<int>(4, 0);
  for (std::size_t t = 0; t < results.size(); ++t) {
    threads.emplace_back([&results, t] {
      auto ok = true;
      for (int i = 0; i < 500; ++i) {
        ok = ok && nhs_number::schema::is_testable(
                       nhs_number::schema::testable_random_sample());
      }
      results[t] = ok ? 1 : 0;
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (auto ok : results) {
    EXPECT_EQ(ok, 1);
  }
}
