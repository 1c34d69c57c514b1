#ifndef FRAMESPLICE_SERIALIZATION_CONFIG_JSON_HPP
#define FRAMESPLICE_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <connect/connect_config.hpp>

namespace framesplice {

// ConnectConfig serialization
inline void to_json(nlohmann::json& j, const ConnectConfig& config) {
    j = {
        {"tolerance", config.tolerance},
        {"elevation_tolerance", config.effective_elevation_tolerance()},
        {"attach_existing_segments", config.attach_existing_segments},
        {"merge_duplicate_nodes", config.merge_duplicate_nodes}
    };
}

inline void from_json(const nlohmann::json& j, ConnectConfig& config) {
    config.tolerance = j.value("tolerance", 1e-6);
    if (j.contains("elevation_tolerance") && !j["elevation_tolerance"].is_null()) {
        config.elevation_tolerance = j["elevation_tolerance"].get<double>();
    } else {
        config.elevation_tolerance.reset();
    }
    config.attach_existing_segments = j.value("attach_existing_segments", true);
    config.merge_duplicate_nodes = j.value("merge_duplicate_nodes", false);
}

}  // namespace framesplice

#endif // FRAMESPLICE_SERIALIZATION_CONFIG_JSON_HPP
