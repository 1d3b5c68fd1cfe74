#include <inspection_model/project.hpp>
#include <uuid.h>
#include <algorithm>
#include <array>
#include <functional>
#include <random>

namespace inspection_model {

namespace {

uuids::uuid random_uuid() {
    static std::mt19937 engine = [] {
        std::random_device rd;
        std::array<int, std::mt19937::state_size> seed_data{};
        std::generate(seed_data.begin(), seed_data.end(), std::ref(rd));
        std::seed_seq seq(seed_data.begin(), seed_data.end());
        return std::mt19937(seq);
    }();
    static uuids::uuid_random_generator generator{engine};
    return generator();
}

} // namespace

Project Project::create_empty() {
    Project p;
    p.id = new_id("proj");
    return p;
}

std::string new_id(std::string_view prefix) {
    std::string hex = uuids::to_string(random_uuid());
    hex.erase(std::remove(hex.begin(), hex.end(), '-'), hex.end());

    std::string id(prefix);
    id += '_';
    id += hex.substr(0, 10);
    return id;
}

} // namespace inspection_model
