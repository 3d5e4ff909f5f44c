#include <faultline/benchmark/record_generator.h>
#include <faultline/core/ids.h>

#include <array>

namespace faultline::benchmark {

std::vector<store::Document> generateRecords(int count, std::mt19937_64& rng) {
    static constexpr std::array<const char*, 3> kStatuses{"ACTIVE", "INACTIVE", "MAINTENANCE"};
    static constexpr std::array<const char*, 3> kTypes{"sensor", "actuator", "controller"};
    std::uniform_int_distribution<std::size_t> pick(0, 2);
    std::uniform_real_distribution<double> value(0.0, 100.0);

    std::vector<store::Document> out;
    out.reserve(static_cast<std::size_t>(count > 0 ? count : 0));
    for (int i = 0; i < count; ++i) {
        out.push_back(store::Document{{"id", generateUUID(rng)},
                                      {"name", "Device " + std::to_string(i)},
                                      {"status", kStatuses[pick(rng)]},
                                      {"type", kTypes[pick(rng)]},
                                      {"value", value(rng)},
                                      {"timestamp", isoTimestamp(std::chrono::system_clock::now())}});
    }
    return out;
}

} // namespace faultline::benchmark
