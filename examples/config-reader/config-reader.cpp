#include <array>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "serde/serde.hpp"

using namespace serde;

// =============================================================================
// Boundary condition enum with ADL string conversion
// =============================================================================

enum class boundary_condition { periodic, outflow, reflecting };

inline const char* to_string(boundary_condition bc) {
    switch (bc) {
        case boundary_condition::periodic: return "periodic";
        case boundary_condition::outflow: return "outflow";
        case boundary_condition::reflecting: return "reflecting";
    }
    return "unknown";
}

inline boundary_condition from_string(std::type_identity<boundary_condition>, const std::string& s) {
    if (s == "periodic") return boundary_condition::periodic;
    if (s == "outflow") return boundary_condition::outflow;
    if (s == "reflecting") return boundary_condition::reflecting;
    throw std::runtime_error("invalid boundary_condition: " + s);
}

inline auto enum_values(std::type_identity<boundary_condition>) {
    return std::array{boundary_condition::periodic, boundary_condition::outflow, boundary_condition::reflecting};
}

// =============================================================================
// Source terms, tagged by kind
// =============================================================================

struct source_t : typetag::base_t {
    static constexpr const char* type_name = "source_t";
    static auto typetag_format() { return typetag::internal("kind"); }
};

struct point_source_t : typetag::variant_t<point_source_t, source_t> {
    static constexpr const char* typetag = "point";
    std::array<double, 3> position = {0.0, 0.0, 0.0};
    double amplitude = 1.0;

    auto fields() const {
        return std::make_tuple(field("position", position), field("amplitude", amplitude).optional());
    }

    auto fields() {
        return std::make_tuple(field("position", position), field("amplitude", amplitude).optional());
    }
};

struct shell_source_t : typetag::variant_t<shell_source_t, source_t> {
    static constexpr const char* typetag = "shell";
    double radius = 0.0;
    double width = 0.1;

    auto fields() const {
        return std::make_tuple(field("radius", radius), field("width", width).optional());
    }

    auto fields() {
        return std::make_tuple(field("radius", radius), field("width", width).optional());
    }
};

// =============================================================================
// Nested configuration structures
// =============================================================================

struct boundary_t {
    boundary_condition type = boundary_condition::periodic;
    double value = 0.0;

    auto fields() const {
        return std::make_tuple(field("type", type), field("value", value).optional());
    }

    auto fields() {
        return std::make_tuple(field("type", type), field("value", value).optional());
    }
};

struct mesh_t {
    std::array<int, 3> resolution = {1, 1, 1};
    std::array<double, 3> lower = {0.0, 0.0, 0.0};
    std::array<double, 3> upper = {1.0, 1.0, 1.0};
    boundary_t boundary_lo;
    boundary_t boundary_hi;

    auto fields() const {
        return std::make_tuple(
            field("resolution", resolution),
            field("lower", lower),
            field("upper", upper),
            field("boundary_lo", boundary_lo).optional(),
            field("boundary_hi", boundary_hi).optional()
        );
    }

    auto fields() {
        return std::make_tuple(
            field("resolution", resolution),
            field("lower", lower),
            field("upper", upper),
            field("boundary_lo", boundary_lo).optional(),
            field("boundary_hi", boundary_hi).optional()
        );
    }
};

struct physics_t {
    double gamma = 5.0 / 3.0;
    double cfl = 0.4;
    std::vector<double> diffusion_coeffs;

    auto fields() const {
        return std::make_tuple(
            field("gamma", gamma).optional(),
            field("cfl", cfl).alias("courant").optional(),
            field("diffusion_coeffs", diffusion_coeffs).optional()
        );
    }

    auto fields() {
        return std::make_tuple(
            field("gamma", gamma).optional(),
            field("cfl", cfl).alias("courant").optional(),
            field("diffusion_coeffs", diffusion_coeffs).optional()
        );
    }
};

struct output_t {
    std::string directory = ".";
    std::string prefix = "chkpt";
    std::vector<double> snapshot_times;
    std::optional<int> checkpoint_interval;
    std::map<std::string, double> timeseries;

    auto fields() const {
        return std::make_tuple(
            field("directory", directory).optional(),
            field("prefix", prefix).optional(),
            field("snapshot_times", snapshot_times).optional(),
            field("checkpoint_interval", checkpoint_interval),
            field("timeseries", timeseries).optional()
        );
    }

    auto fields() {
        return std::make_tuple(
            field("directory", directory).optional(),
            field("prefix", prefix).optional(),
            field("snapshot_times", snapshot_times).optional(),
            field("checkpoint_interval", checkpoint_interval),
            field("timeseries", timeseries).optional()
        );
    }
};

struct config_t {
    static constexpr const char* type_name = "config_t";

    std::string title;
    std::string description;
    int version = 1;
    double t_final = 1.0;
    int max_iterations = 0;
    mesh_t mesh;
    physics_t physics;
    std::vector<std::unique_ptr<source_t>> sources;
    output_t output;

    auto fields() const {
        return std::make_tuple(
            field("title", title),
            field("description", description).optional(),
            field("version", version).optional(),
            field("t_final", t_final),
            field("max_iterations", max_iterations).alias("max_iter").optional(),
            field("mesh", mesh),
            field("physics", physics).optional(),
            field("sources", sources).optional(),
            field("output", output).optional()
        );
    }

    auto fields() {
        return std::make_tuple(
            field("title", title),
            field("description", description).optional(),
            field("version", version).optional(),
            field("t_final", t_final),
            field("max_iterations", max_iterations).alias("max_iter").optional(),
            field("mesh", mesh),
            field("physics", physics).optional(),
            field("sources", sources).optional(),
            field("output", output).optional()
        );
    }
};

// =============================================================================
// Loading
// =============================================================================

static auto ends_with(const std::string& s, const std::string& suffix) -> bool {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static void load(config_t& config, const std::string& path) {
    auto file = std::ifstream(path);

    if (!file) {
        throw serde::error_t("cannot open file '" + path + "'");
    }
    if (ends_with(path, ".json")) {
        from_json(config, file);
    } else {
        from_yaml(config, file);
    }
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml|config.json> [key=value ...] [-v]\n";
        return 1;
    }

    typetag::register_variant<source_t, point_source_t>();
    typetag::register_variant<source_t, shell_source_t>();

    try {
        auto config = config_t();
        auto overrides = std::vector<std::string>();

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "-v") == 0) {
                set_log_stream(&std::cerr);
            } else {
                overrides.push_back(argv[i]);
            }
        }
        load(config, argv[1]);

        for (const auto& arg : overrides) {
            auto eq = arg.find('=');

            if (eq == std::string::npos) {
                throw serde::error_t("expected key=value, found '" + arg + "'");
            }
            set(config, arg.substr(0, eq), arg.substr(eq + 1));
        }

        std::cout << "Configuration loaded successfully!\n";
        std::cout << "========================================\n\n";
        std::cout << to_pretty_json(config) << "\n";

        std::cout << "\n========================================\n";
        std::cout << "As YAML:\n";
        std::cout << "========================================\n\n";
        std::cout << to_yaml(config) << "\n";

    } catch (const serde::error_t& e) {
        std::cerr << "Error reading config: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
