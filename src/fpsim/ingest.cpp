#include "fpsim/ingest.hpp"

#include "fpsim/types.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fpsim {
namespace {

using nlohmann::json;

constexpr int kMaxExponent = 16;

const json& optionalNode(const json& root, const char* key) {
    static const json kNull;
    const auto it = root.find(key);
    return it == root.end() ? kNull : *it;
}

double requirePositive(const std::string& field, double value) {
    if (!(value > 0.0)) {
        throw ConfigurationError(field + " must be positive");
    }
    return value;
}

double requireNonNegative(const std::string& field, double value) {
    if (!(value >= 0.0)) {
        throw ConfigurationError(field + " must be non-negative");
    }
    return value;
}

std::size_t requireGridSize(const std::string& field, const json& value) {
    if (!value.is_number_integer() || value.get<long long>() < 2) {
        throw ConfigurationError(field + " must be an integer of at least 2");
    }
    return value.get<std::size_t>();
}

double requireNumber(const std::string& field, const json& value) {
    if (!value.is_number()) {
        throw ConfigurationError(field + " must be a number");
    }
    const double out = value.get<double>();
    if (!std::isfinite(out)) {
        throw ConfigurationError(field + " must be finite");
    }
    return out;
}

PolynomialField parseField(const std::string& field, const json& value) {
    if (value.is_number()) {
        return PolynomialField::constant(requireNumber(field, value));
    }
    if (!value.is_array()) {
        throw ConfigurationError(field + " must be a number or an array of polynomial terms");
    }
    PolynomialField out;
    for (std::size_t k = 0; k < value.size(); ++k) {
        const json& term = value.at(k);
        const std::string where = field + "[" + std::to_string(k) + "]";
        if (!term.is_object()) {
            throw ConfigurationError(where + " must be an object {c, px, py}");
        }
        PolynomialField::Term entry{};
        entry.c = requireNumber(where + ".c", term.at("c"));
        entry.px = term.value("px", 0);
        entry.py = term.value("py", 0);
        if (entry.px < 0 || entry.py < 0 || entry.px > kMaxExponent || entry.py > kMaxExponent) {
            throw ConfigurationError(where + " exponents must lie in [0, " + std::to_string(kMaxExponent) + "]");
        }
        out.terms.push_back(entry);
    }
    return out;
}

// 2D fields are {"x": ..., "y": ...}; a bare value applies to both axes.
void parseAxisFields(const std::string& field, const json& value, PolynomialField& fx, PolynomialField& fy) {
    if (value.is_object()) {
        fx = parseField(field + ".x", value.at("x"));
        fy = parseField(field + ".y", value.at("y"));
    } else {
        fx = parseField(field, value);
        fy = fx;
    }
}

void parseBoundary(const json& root, ScenarioSpec& spec) {
    if (!root.contains("bc_type")) {
        return;
    }
    const json& bc = root.at("bc_type");
    if (bc.is_string()) {
        spec.boundaryX = parseBoundaryKind(bc.get<std::string>());
        spec.boundaryY = spec.boundaryX;
        return;
    }
    if (bc.is_object() && spec.dimension == 2) {
        spec.boundaryX = parseBoundaryKind(bc.at("x").get<std::string>());
        spec.boundaryY = parseBoundaryKind(bc.at("y").get<std::string>());
        return;
    }
    throw ConfigurationError("bc_type must be one of \"reflecting\", \"absorbing\", \"periodic\"");
}

void parsePair(const std::string& field, const json& value, double& a, double& b) {
    if (value.is_array()) {
        if (value.size() != 2) {
            throw ConfigurationError(field + " must hold two values");
        }
        a = requireNumber(field + "[0]", value.at(0));
        b = requireNumber(field + "[1]", value.at(1));
    } else {
        a = requireNumber(field, value);
        b = a;
    }
}

InitialConditionSpec parseInitialCondition(const json& node, int dimension) {
    InitialConditionSpec ic{};
    if (node.is_null()) {
        return ic;
    }
    const std::string type = node.value("type", std::string{"standard_normal"});
    ic.normalize = node.value("normalize", true);
    if (type == "standard_normal") {
        ic.kind = InitialConditionSpec::Kind::StandardNormal;
    } else if (type == "gaussian") {
        ic.kind = InitialConditionSpec::Kind::Gaussian;
        if (dimension == 1) {
            ic.centerX = requireNumber("initial_condition.center", node.at("center"));
            ic.widthX = requirePositive("initial_condition.width",
                                        requireNumber("initial_condition.width", node.at("width")));
        } else {
            parsePair("initial_condition.center", node.at("center"), ic.centerX, ic.centerY);
            parsePair("initial_condition.width", node.at("width"), ic.widthX, ic.widthY);
            requirePositive("initial_condition.width", ic.widthX);
            requirePositive("initial_condition.width", ic.widthY);
        }
    } else if (type == "uniform") {
        ic.kind = InitialConditionSpec::Kind::Uniform;
    } else if (type == "values") {
        ic.kind = InitialConditionSpec::Kind::Values;
        const json& values = node.at("values");
        if (!values.is_array()) {
            throw ConfigurationError("initial_condition.values must be an array");
        }
        ic.values.reserve(values.size());
        for (std::size_t k = 0; k < values.size(); ++k) {
            ic.values.push_back(requireNumber("initial_condition.values[" + std::to_string(k) + "]", values.at(k)));
        }
    } else {
        throw ConfigurationError("Unsupported initial condition type: " + type);
    }
    return ic;
}

void parseRun(const json& node, RunOptions& run) {
    if (node.is_null()) {
        return;
    }
    if (node.contains("total_time")) {
        run.totalTime = requirePositive("run.total_time", requireNumber("run.total_time", node.at("total_time")));
    }
    if (node.contains("dt")) {
        const json& dt = node.at("dt");
        if (dt.is_string()) {
            if (dt.get<std::string>() != "auto") {
                throw ConfigurationError("run.dt must be a positive number or \"auto\"");
            }
            run.dt.reset();
        } else {
            run.dt = requirePositive("run.dt", requireNumber("run.dt", dt));
        }
    }
    if (node.contains("steps")) {
        const json& steps = node.at("steps");
        if (!steps.is_number_integer() || steps.get<long long>() <= 0) {
            throw ConfigurationError("run.steps must be a positive integer");
        }
        run.steps = steps.get<std::size_t>();
    }
    if (node.contains("sample_stride")) {
        const json& stride = node.at("sample_stride");
        if (!stride.is_number_integer() || stride.get<long long>() <= 0) {
            throw ConfigurationError("run.sample_stride must be a positive integer");
        }
        run.sampleStride = stride.get<std::size_t>();
    }
    if (node.contains("courant")) {
        run.courant = requirePositive("run.courant", requireNumber("run.courant", node.at("courant")));
    }
    if (node.contains("stability_tolerance")) {
        run.stabilityTolerance = requireNonNegative(
            "run.stability_tolerance", requireNumber("run.stability_tolerance", node.at("stability_tolerance")));
    }
    if (node.contains("mass_tolerance")) {
        run.massTolerance = requirePositive("run.mass_tolerance",
                                            requireNumber("run.mass_tolerance", node.at("mass_tolerance")));
    }
}

void parseOutputs(const json& node, ScenarioSpec::Outputs& outputs) {
    if (node.is_null()) {
        return;
    }
    outputs.csv = node.value("csv", std::string{});
    outputs.massHistory = node.value("mass_history", std::string{});
    outputs.marginals = node.value("marginals", std::string{});
    outputs.vtkDirectory = node.value("vtk_series", std::string{});
    outputs.html = node.value("html", std::string{});
}

ScenarioSpec parseScenario(const json& root) {
    if (!root.is_object()) {
        throw ConfigurationError("Scenario JSON must be an object");
    }

    ScenarioSpec spec{};
    spec.version = root.value("version", std::string{});
    if (spec.version.empty()) {
        throw ConfigurationError("Scenario JSON missing required field: version");
    }
    if (spec.version != "0.1") {
        throw ConfigurationError("Unsupported scenario version: " + spec.version);
    }

    spec.dimension = root.value("dimension", 1);
    if (spec.dimension != 1 && spec.dimension != 2) {
        throw ConfigurationError("dimension must be 1 or 2");
    }

    spec.xMin = requireNumber("x_min", root.at("x_min"));
    spec.xMax = requireNumber("x_max", root.at("x_max"));
    if (!(spec.xMin < spec.xMax)) {
        throw ConfigurationError("x_min must be below x_max");
    }

    const json& n = root.at("N");
    if (spec.dimension == 1) {
        spec.nx = requireGridSize("N", n);
        spec.ny = 1;
        spec.driftX = parseField("A", root.at("A"));
        spec.diffusionX = parseField("D", root.at("D"));
    } else {
        spec.yMin = requireNumber("y_min", root.at("y_min"));
        spec.yMax = requireNumber("y_max", root.at("y_max"));
        if (!(spec.yMin < spec.yMax)) {
            throw ConfigurationError("y_min must be below y_max");
        }
        if (n.is_object()) {
            spec.nx = requireGridSize("N.x", n.at("x"));
            spec.ny = requireGridSize("N.y", n.at("y"));
        } else {
            spec.nx = requireGridSize("N", n);
            spec.ny = spec.nx;
        }
        parseAxisFields("A", root.at("A"), spec.driftX, spec.driftY);
        parseAxisFields("D", root.at("D"), spec.diffusionX, spec.diffusionY);
    }

    parseBoundary(root, spec);
    if (root.contains("diffusion_form")) {
        spec.diffusionForm = parseDiffusionForm(root.at("diffusion_form").get<std::string>());
    }

    spec.initial = parseInitialCondition(optionalNode(root, "initial_condition"), spec.dimension);
    if (spec.initial.kind == InitialConditionSpec::Kind::Values) {
        const std::size_t expected = spec.nx * spec.ny;
        if (spec.initial.values.size() != expected) {
            throw ConfigurationError("initial_condition.values has " + std::to_string(spec.initial.values.size()) +
                                     " entries, expected " + std::to_string(expected));
        }
    }

    parseRun(optionalNode(root, "run"), spec.run);
    parseOutputs(optionalNode(root, "outputs"), spec.outputs);
    return spec;
}

}  // namespace

double PolynomialField::operator()(double x, double y) const {
    double sum = 0.0;
    for (const auto& term : terms) {
        double value = term.c;
        for (int k = 0; k < term.px; ++k) {
            value *= x;
        }
        for (int k = 0; k < term.py; ++k) {
            value *= y;
        }
        sum += value;
    }
    return sum;
}

ScenarioSpec loadScenarioFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open scenario JSON: " + path);
    }

    json root;
    try {
        input >> root;
        return parseScenario(root);
    } catch (const json::parse_error& ex) {
        throw ConfigurationError("Malformed scenario JSON " + path + ": " + ex.what());
    } catch (const json::exception& ex) {
        throw ConfigurationError("Invalid scenario " + path + ": " + ex.what());
    }
}

ScenarioSpec parseScenarioJson(const std::string& text) {
    try {
        return parseScenario(json::parse(text));
    } catch (const json::parse_error& ex) {
        throw ConfigurationError(std::string("Malformed scenario JSON: ") + ex.what());
    } catch (const json::exception& ex) {
        throw ConfigurationError(std::string("Invalid scenario: ") + ex.what());
    }
}

Config1D makeConfig1D(const ScenarioSpec& spec) {
    if (spec.dimension != 1) {
        throw ConfigurationError("makeConfig1D: scenario is " + std::to_string(spec.dimension) + "D");
    }
    Config1D config{};
    const PolynomialField drift = spec.driftX;
    const PolynomialField diffusion = spec.diffusionX;
    config.drift = [drift](double x) { return drift(x); };
    config.diffusion = [diffusion](double x) { return diffusion(x); };
    config.xMin = spec.xMin;
    config.xMax = spec.xMax;
    config.nx = spec.nx;
    config.boundary = spec.boundaryX;
    config.diffusionForm = spec.diffusionForm;
    config.normalize = spec.initial.normalize;

    const InitialConditionSpec ic = spec.initial;
    switch (ic.kind) {
        case InitialConditionSpec::Kind::StandardNormal:
            break;
        case InitialConditionSpec::Kind::Gaussian:
            config.initialCondition = [ic](double x) {
                const double u = (x - ic.centerX) / ic.widthX;
                return std::exp(-0.5 * u * u) / (ic.widthX * std::sqrt(2.0 * PI));
            };
            break;
        case InitialConditionSpec::Kind::Uniform:
            config.initialCondition = [](double) { return 1.0; };
            break;
        case InitialConditionSpec::Kind::Values:
            config.initialDensity = ic.values;
            break;
    }
    return config;
}

Config2D makeConfig2D(const ScenarioSpec& spec) {
    if (spec.dimension != 2) {
        throw ConfigurationError("makeConfig2D: scenario is " + std::to_string(spec.dimension) + "D");
    }
    Config2D config{};
    const PolynomialField ax = spec.driftX;
    const PolynomialField ay = spec.driftY;
    const PolynomialField dxField = spec.diffusionX;
    const PolynomialField dyField = spec.diffusionY;
    config.driftX = [ax](double x, double y) { return ax(x, y); };
    config.driftY = [ay](double x, double y) { return ay(x, y); };
    config.diffusionX = [dxField](double x, double y) { return dxField(x, y); };
    config.diffusionY = [dyField](double x, double y) { return dyField(x, y); };
    config.xMin = spec.xMin;
    config.xMax = spec.xMax;
    config.yMin = spec.yMin;
    config.yMax = spec.yMax;
    config.nx = spec.nx;
    config.ny = spec.ny;
    config.boundaryX = spec.boundaryX;
    config.boundaryY = spec.boundaryY;
    config.diffusionForm = spec.diffusionForm;
    config.normalize = spec.initial.normalize;

    const InitialConditionSpec ic = spec.initial;
    switch (ic.kind) {
        case InitialConditionSpec::Kind::StandardNormal:
            break;
        case InitialConditionSpec::Kind::Gaussian:
            config.initialCondition = [ic](double x, double y) {
                const double u = (x - ic.centerX) / ic.widthX;
                const double v = (y - ic.centerY) / ic.widthY;
                return std::exp(-0.5 * (u * u + v * v)) / (2.0 * PI * ic.widthX * ic.widthY);
            };
            break;
        case InitialConditionSpec::Kind::Uniform:
            config.initialCondition = [](double, double) { return 1.0; };
            break;
        case InitialConditionSpec::Kind::Values:
            config.initialDensity = ic.values;
            break;
    }
    return config;
}

ScenarioSpec defaultScenario(int dimension) {
    ScenarioSpec spec{};
    spec.version = "0.1";
    spec.dimension = dimension;
    spec.xMin = -5.0;
    spec.xMax = 5.0;
    spec.initial.kind = InitialConditionSpec::Kind::StandardNormal;
    spec.initial.normalize = true;
    spec.driftX.terms = {{-0.2, 3, 0}};
    spec.diffusionX = PolynomialField::constant(0.5);
    spec.run.totalTime = 1.0;
    spec.run.sampleStride = 10;

    if (dimension == 1) {
        spec.nx = 100;
        spec.ny = 1;
        return spec;
    }
    if (dimension != 2) {
        throw ConfigurationError("dimension must be 1 or 2");
    }
    spec.yMin = -5.0;
    spec.yMax = 5.0;
    spec.nx = 50;
    spec.ny = 50;
    spec.driftY.terms = {{-1.0, 0, 1}};
    spec.diffusionY = PolynomialField::constant(0.5);
    return spec;
}

}  // namespace fpsim
