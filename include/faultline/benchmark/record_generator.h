#pragma once

#include <faultline/store/store_driver.h>

#include <random>
#include <vector>

namespace faultline::benchmark {

/**
 * Device records for the load phase: id (uuid v4), name "Device i", status
 * ACTIVE|INACTIVE|MAINTENANCE, type sensor|actuator|controller, value in
 * [0, 100) and an ISO-8601 timestamp.
 */
std::vector<store::Document> generateRecords(int count, std::mt19937_64& rng);

} // namespace faultline::benchmark
