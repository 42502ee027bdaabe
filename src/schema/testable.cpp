#include <nhs_number/schema/testable.hpp>

namespace nhs_number::schema {

nhs_number_t testable_random_sample() {
  thread_local auto engine = std::mt19937_64{std::random_device{}()};
  return testable_random_sample(engine);
}

}  // namespace nhs_number::schema
