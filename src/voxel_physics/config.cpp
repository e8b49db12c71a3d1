/// @file config.cpp
/// @brief Configuration validation and JSON (de)serialization

#include <voxel/physics/config.hpp>
#include <voxel/core/log.hpp>

#include <cmath>
#include <fstream>

namespace voxel_physics {

using voxel_core::ConfigError;
using voxel_core::Error;
using voxel_core::Result;

namespace {

bool finite_positive(float v) {
    return std::isfinite(v) && v > 0.0f;
}

nlohmann::json vec3_to_json(const Vec3& v) {
    return nlohmann::json::array({v.x, v.y, v.z});
}

Result<Vec3> vec3_from_json(const nlohmann::json& j, const std::string& field) {
    if (!j.is_array() || j.size() != 3) {
        return Error(ConfigError::parse_error("'" + field + "' must be an array of 3 numbers"));
    }
    for (const auto& c : j) {
        if (!c.is_number()) {
            return Error(ConfigError::parse_error("'" + field + "' must be an array of 3 numbers"));
        }
    }
    return Vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
}

template<typename T>
void read_if_present(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

} // anonymous namespace

// =============================================================================
// Validation
// =============================================================================

Result<void> SpatialHashConfig::validate() const {
    if (!finite_positive(cell_size)) {
        return Error(ConfigError::invalid_value("spatial_hash.cell_size", "must be finite and > 0"));
    }
    if (!voxel_math::is_finite(world_min) || !voxel_math::is_finite(world_max)) {
        return Error(ConfigError::invalid_value("spatial_hash.world_bounds", "must be finite"));
    }
    if (world_min.x >= world_max.x || world_min.y >= world_max.y || world_min.z >= world_max.z) {
        return Error(ConfigError::inverted_bounds("spatial_hash.world_bounds"));
    }
    if (expected_entities_per_cell == 0) {
        return Error(ConfigError::invalid_value("spatial_hash.expected_entities_per_cell", "must be >= 1"));
    }
    return voxel_core::Ok();
}

Result<void> SolverConfig::validate() const {
    if (iterations == 0) {
        return Error(ConfigError::invalid_value("solver.iterations", "must be >= 1"));
    }
    if (!std::isfinite(position_correction_rate) || position_correction_rate < 0.0f || position_correction_rate > 1.0f) {
        return Error(ConfigError::invalid_value("solver.position_correction_rate", "must be in [0, 1]"));
    }
    if (!std::isfinite(penetration_slop) || penetration_slop < 0.0f) {
        return Error(ConfigError::invalid_value("solver.penetration_slop", "must be >= 0"));
    }
    if (!std::isfinite(default_restitution) || default_restitution < 0.0f || default_restitution > 1.0f) {
        return Error(ConfigError::invalid_value("solver.default_restitution", "must be in [0, 1]"));
    }
    if (!std::isfinite(default_friction) || default_friction < 0.0f) {
        return Error(ConfigError::invalid_value("solver.default_friction", "must be >= 0"));
    }
    if (!std::isfinite(restitution_threshold) || restitution_threshold < 0.0f) {
        return Error(ConfigError::invalid_value("solver.restitution_threshold", "must be >= 0"));
    }
    if (max_pairs == 0) {
        return Error(ConfigError::invalid_value("solver.max_pairs", "must be >= 1"));
    }
    if (batch_size == 0) {
        return Error(ConfigError::invalid_value("solver.batch_size", "must be >= 1"));
    }
    return voxel_core::Ok();
}

Result<void> IntegratorConfig::validate() const {
    if (!voxel_math::is_finite(gravity)) {
        return Error(ConfigError::invalid_value("integrator.gravity", "must be finite"));
    }
    if (!finite_positive(terminal_velocity)) {
        return Error(ConfigError::invalid_value("integrator.terminal_velocity", "must be finite and > 0"));
    }
    if (!std::isfinite(velocity_epsilon) || velocity_epsilon < 0.0f) {
        return Error(ConfigError::invalid_value("integrator.velocity_epsilon", "must be >= 0"));
    }
    if (!finite_positive(fixed_timestep)) {
        return Error(ConfigError::invalid_value("integrator.fixed_timestep", "must be finite and > 0"));
    }
    if (!std::isfinite(max_frame_time) || max_frame_time < fixed_timestep) {
        return Error(ConfigError::invalid_value("integrator.max_frame_time", "must be >= fixed_timestep"));
    }
    if (substeps == 0) {
        return Error(ConfigError::invalid_value("integrator.substeps", "must be >= 1"));
    }
    if (!std::isfinite(water_damping) || water_damping < 0.0f || water_damping > 1.0f) {
        return Error(ConfigError::invalid_value("integrator.water_damping", "must be in [0, 1]"));
    }
    if (!finite_positive(water_max_fall_speed)) {
        return Error(ConfigError::invalid_value("integrator.water_max_fall_speed", "must be finite and > 0"));
    }
    if (!std::isfinite(ladder_drift_threshold) || ladder_drift_threshold < 0.0f) {
        return Error(ConfigError::invalid_value("integrator.ladder_drift_threshold", "must be >= 0"));
    }
    return voxel_core::Ok();
}

Result<void> TerrainConfig::validate() const {
    auto contains_air = [](const std::vector<std::uint16_t>& ids) {
        for (auto id : ids) {
            if (id == 0) return true;
        }
        return false;
    };
    if (contains_air(water_blocks)) {
        return Error(ConfigError::invalid_value("terrain.water_blocks", "air (0) cannot be classified"));
    }
    if (contains_air(ladder_blocks)) {
        return Error(ConfigError::invalid_value("terrain.ladder_blocks", "air (0) cannot be classified"));
    }
    if (contains_air(passable_blocks)) {
        return Error(ConfigError::invalid_value("terrain.passable_blocks", "air (0) cannot be classified"));
    }
    return voxel_core::Ok();
}

Result<void> PhysicsConfig::validate() const {
    if (max_entities == 0) {
        return Error(ConfigError::invalid_value("max_entities", "must be >= 1"));
    }
    if (auto r = spatial_hash.validate(); !r) return r;
    if (auto r = solver.validate(); !r) return r;
    if (auto r = integrator.validate(); !r) return r;
    return terrain.validate();
}

// =============================================================================
// JSON
// =============================================================================

Result<PhysicsConfig> PhysicsConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(ConfigError::parse_error("physics config must be an object"));
    }

    PhysicsConfig config;

    try {
        read_if_present(j, "max_entities", config.max_entities);

        if (j.contains("spatial_hash")) {
            const auto& sh = j.at("spatial_hash");
            read_if_present(sh, "cell_size", config.spatial_hash.cell_size);
            read_if_present(sh, "expected_entities_per_cell", config.spatial_hash.expected_entities_per_cell);
            if (sh.contains("world_min")) {
                auto v = vec3_from_json(sh.at("world_min"), "spatial_hash.world_min");
                if (!v) return v.error();
                config.spatial_hash.world_min = *v;
            }
            if (sh.contains("world_max")) {
                auto v = vec3_from_json(sh.at("world_max"), "spatial_hash.world_max");
                if (!v) return v.error();
                config.spatial_hash.world_max = *v;
            }
        }

        if (j.contains("solver")) {
            const auto& s = j.at("solver");
            read_if_present(s, "worker_threads", config.solver.worker_threads);
            read_if_present(s, "iterations", config.solver.iterations);
            read_if_present(s, "position_correction_rate", config.solver.position_correction_rate);
            read_if_present(s, "penetration_slop", config.solver.penetration_slop);
            read_if_present(s, "default_restitution", config.solver.default_restitution);
            read_if_present(s, "default_friction", config.solver.default_friction);
            read_if_present(s, "restitution_threshold", config.solver.restitution_threshold);
            read_if_present(s, "max_pairs", config.solver.max_pairs);
            read_if_present(s, "parallel_resolution", config.solver.parallel_resolution);
            read_if_present(s, "batch_size", config.solver.batch_size);
        }

        if (j.contains("integrator")) {
            const auto& in = j.at("integrator");
            if (in.contains("gravity")) {
                auto v = vec3_from_json(in.at("gravity"), "integrator.gravity");
                if (!v) return v.error();
                config.integrator.gravity = *v;
            }
            read_if_present(in, "terminal_velocity", config.integrator.terminal_velocity);
            read_if_present(in, "velocity_epsilon", config.integrator.velocity_epsilon);
            read_if_present(in, "fixed_timestep", config.integrator.fixed_timestep);
            read_if_present(in, "max_frame_time", config.integrator.max_frame_time);
            read_if_present(in, "substeps", config.integrator.substeps);
            read_if_present(in, "water_damping", config.integrator.water_damping);
            read_if_present(in, "water_max_fall_speed", config.integrator.water_max_fall_speed);
            read_if_present(in, "ladder_drift_threshold", config.integrator.ladder_drift_threshold);
        }

        if (j.contains("terrain")) {
            const auto& t = j.at("terrain");
            read_if_present(t, "water_blocks", config.terrain.water_blocks);
            read_if_present(t, "ladder_blocks", config.terrain.ladder_blocks);
            read_if_present(t, "passable_blocks", config.terrain.passable_blocks);
        }
    } catch (const nlohmann::json::exception& e) {
        return Error(ConfigError::parse_error(e.what()));
    }

    return config;
}

nlohmann::json PhysicsConfig::to_json() const {
    nlohmann::json j;
    j["max_entities"] = max_entities;

    j["spatial_hash"] = {
        {"cell_size", spatial_hash.cell_size},
        {"world_min", vec3_to_json(spatial_hash.world_min)},
        {"world_max", vec3_to_json(spatial_hash.world_max)},
        {"expected_entities_per_cell", spatial_hash.expected_entities_per_cell},
    };

    j["solver"] = {
        {"worker_threads", solver.worker_threads},
        {"iterations", solver.iterations},
        {"position_correction_rate", solver.position_correction_rate},
        {"penetration_slop", solver.penetration_slop},
        {"default_restitution", solver.default_restitution},
        {"default_friction", solver.default_friction},
        {"restitution_threshold", solver.restitution_threshold},
        {"max_pairs", solver.max_pairs},
        {"parallel_resolution", solver.parallel_resolution},
        {"batch_size", solver.batch_size},
    };

    j["integrator"] = {
        {"gravity", vec3_to_json(integrator.gravity)},
        {"terminal_velocity", integrator.terminal_velocity},
        {"velocity_epsilon", integrator.velocity_epsilon},
        {"fixed_timestep", integrator.fixed_timestep},
        {"max_frame_time", integrator.max_frame_time},
        {"substeps", integrator.substeps},
        {"water_damping", integrator.water_damping},
        {"water_max_fall_speed", integrator.water_max_fall_speed},
        {"ladder_drift_threshold", integrator.ladder_drift_threshold},
    };

    j["terrain"] = {
        {"water_blocks", terrain.water_blocks},
        {"ladder_blocks", terrain.ladder_blocks},
        {"passable_blocks", terrain.passable_blocks},
    };

    return j;
}

Result<PhysicsConfig> PhysicsConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ConfigError::io_error(path));
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ConfigError::parse_error(e.what())).with_context("path", path);
    }

    auto config = from_json(j);
    if (!config) {
        return config;
    }
    if (auto valid = config->validate(); !valid) {
        return valid.error();
    }

    voxel_core::physics_logger()->info("Loaded physics config from '{}'", path);
    return config;
}

} // namespace voxel_physics
