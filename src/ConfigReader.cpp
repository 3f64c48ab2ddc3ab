#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace MBFD {

namespace {

const char* const OPTIONS_SECTION = "OPTIONS";
const char* const SCENARIO_PREFIX = "SCENARIO";
const char* const SWEEP_SECTION = "SWEEP";

// Keys that name the ground temperature; the differential wins when both are given
const char* const GROUND_TEMPERATURE_KEYS[] = {
    "mean_annual_temperature_difference",
    "mean_annual_temperature",
    "mean_annual_ground_temperature"
};

} // namespace

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& contents) {
    std::istringstream in(contents);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleInUnit(const std::string& section, const std::string& key,
                                     double default_val, const std::string& target_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    double parsed_value;
    std::string parsed_unit;

    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "'" << std::endl;
        return default_val;
    }

    if (parsed_unit.empty() || target_unit.empty()) {
        return parsed_value;
    }

    // "5 degF" given for a differential means 5 degF of difference, no offset
    const Unit* from = unit_system_.getUnit(parsed_unit);
    const Unit* to = unit_system_.getUnit(target_unit);
    if (from && to && from->category == "temperature" &&
        to->category == "temperature_difference") {
        return parsed_value * from->to_base / to->to_base;
    }

    try {
        return unit_system_.convert(parsed_value, parsed_unit, target_unit);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto it = data.find(section);
    if (it != data.end()) {
        for (const auto& pair : it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Scenario Keys
// =============================================================================

const std::map<std::string, std::string>& ConfigReader::scenarioKeys() {
    static const std::map<std::string, std::string> keys = {
        {"thermal_conductivity", "thermal_conductivity"},
        {"dry_density", "dry_density"},
        {"water_content", "fraction"},
        {"mean_annual_temperature_difference", "temperature_difference"},
        {"mean_annual_temperature", "temperature_difference"},
        {"mean_annual_ground_temperature", "temperature"},
        {"air_freezing_index", "freezing_index"},
        {"n_factor", "fraction"},
        {"freezing_season_duration", "duration"},
        {"mean_annual_air_temperature", "temperature"}
    };
    return keys;
}

std::string ConfigReader::unitForKey(const std::string& key, UnitConvention unit_system) const {
    auto it = scenarioKeys().find(key);
    if (it == scenarioKeys().end()) {
        return "";
    }

    const QuantityUnits& units = unitsFor(unit_system);
    const std::string& category = it->second;
    if (category == "thermal_conductivity") return units.thermal_conductivity;
    if (category == "dry_density") return units.dry_density;
    if (category == "temperature_difference") return units.temperature_difference;
    if (category == "temperature") return units.temperature;
    if (category == "freezing_index") return units.freezing_index;
    if (category == "duration") return units.duration;
    return "fraction";
}

void ConfigReader::applyScenarioValue(FrostDepthInput& input, const std::string& key,
                                      double value) {
    if (key == "thermal_conductivity") {
        input.thermal_conductivity = value;
    } else if (key == "dry_density") {
        input.dry_density = value;
    } else if (key == "water_content") {
        input.water_content = value;
    } else if (key == "mean_annual_temperature_difference" || key == "mean_annual_temperature") {
        input.mean_annual_temperature = value;
    } else if (key == "mean_annual_ground_temperature") {
        input.mean_annual_temperature = groundTemperatureDifferential(value, input.unit_system);
    } else if (key == "air_freezing_index") {
        input.air_freezing_index = value;
    } else if (key == "n_factor") {
        input.n_factor = value;
    } else if (key == "freezing_season_duration") {
        input.freezing_season_duration = value;
    } else if (key == "mean_annual_air_temperature") {
        input.mean_annual_air_temperature = value;
    } else {
        throw std::invalid_argument("Unknown scenario key: " + key);
    }
}

// =============================================================================
// Parsing Methods
// =============================================================================

bool ConfigReader::parseRunOptions(RunOptions& options) const {
    if (!hasSection(OPTIONS_SECTION)) return false;

    try {
        options.unit_system = parseUnitConvention(
            getString(OPTIONS_SECTION, "unit_system", toString(options.unit_system)));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Warning: " << e.what() << " - using "
                  << toString(options.unit_system) << std::endl;
    }

    try {
        options.calculator.lambda_method = parseLambdaMethod(
            getString(OPTIONS_SECTION, "lambda_method",
                      toString(options.calculator.lambda_method)));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Warning: " << e.what() << " - using "
                  << toString(options.calculator.lambda_method) << std::endl;
    }

    try {
        options.calculator.surface_temperature_mode = parseSurfaceTemperatureMode(
            getString(OPTIONS_SECTION, "surface_temperature_mode",
                      toString(options.calculator.surface_temperature_mode)));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Warning: " << e.what() << " - using "
                  << toString(options.calculator.surface_temperature_mode) << std::endl;
    }

    options.calculator.round_intermediates =
        getBool(OPTIONS_SECTION, "round_intermediates", options.calculator.round_intermediates);
    options.output_file = getString(OPTIONS_SECTION, "output_file", options.output_file);
    options.print_intermediates =
        getBool(OPTIONS_SECTION, "print_intermediates", options.print_intermediates);

    return true;
}

ConfigReader::ScenarioConfig ConfigReader::parseScenario(const std::string& section,
                                                         UnitConvention unit_system) const {
    ScenarioConfig scenario;

    std::string default_name = section;
    std::string prefix = std::string(SCENARIO_PREFIX) + "_";
    if (section.compare(0, prefix.size(), prefix) == 0 && section.size() > prefix.size()) {
        default_name = section.substr(prefix.size());
    }
    scenario.name = getString(section, "name", default_name);

    FrostDepthInput& input = scenario.input;
    input.unit_system = unit_system;

    // Defaults are the worksheet values, expressed in the declared system
    FrostDepthInput defaults;
    if (unit_system == UnitConvention::METRIC) {
        const QuantityUnits& imp = unitsFor(UnitConvention::IMPERIAL);
        const QuantityUnits& met = unitsFor(UnitConvention::METRIC);
        defaults.thermal_conductivity = unit_system_.convert(
            defaults.thermal_conductivity, imp.thermal_conductivity, met.thermal_conductivity);
        defaults.dry_density = unit_system_.convert(
            defaults.dry_density, imp.dry_density, met.dry_density);
        defaults.mean_annual_temperature = unit_system_.convert(
            defaults.mean_annual_temperature, imp.temperature_difference,
            met.temperature_difference);
        defaults.air_freezing_index = unit_system_.convert(
            defaults.air_freezing_index, imp.freezing_index, met.freezing_index);
        defaults.mean_annual_air_temperature = unit_system_.convert(
            defaults.mean_annual_air_temperature, imp.temperature, met.temperature);
    }

    input.thermal_conductivity = getDoubleInUnit(section, "thermal_conductivity",
        defaults.thermal_conductivity, unitForKey("thermal_conductivity", unit_system));
    input.dry_density = getDoubleInUnit(section, "dry_density",
        defaults.dry_density, unitForKey("dry_density", unit_system));
    input.water_content = getDoubleInUnit(section, "water_content",
        defaults.water_content, "fraction");
    input.air_freezing_index = getDoubleInUnit(section, "air_freezing_index",
        defaults.air_freezing_index, unitForKey("air_freezing_index", unit_system));
    input.n_factor = getDoubleInUnit(section, "n_factor", defaults.n_factor, "fraction");
    input.freezing_season_duration = getDoubleInUnit(section, "freezing_season_duration",
        defaults.freezing_season_duration, unitForKey("freezing_season_duration", unit_system));
    input.mean_annual_air_temperature = getDoubleInUnit(section, "mean_annual_air_temperature",
        defaults.mean_annual_air_temperature,
        unitForKey("mean_annual_air_temperature", unit_system));

    input.mean_annual_temperature = defaults.mean_annual_temperature;
    for (const char* key : GROUND_TEMPERATURE_KEYS) {
        if (!hasKey(section, key)) continue;
        double value = getDoubleInUnit(section, key, 0.0, unitForKey(key, unit_system));
        applyScenarioValue(input, key, value);
        break;
    }

    if (input.water_content > 1.0) {
        std::cerr << "Warning: [" << section << "]: water_content = " << input.water_content
                  << " exceeds 1 as a fraction; append '%' for percent values" << std::endl;
    }

    return scenario;
}

std::vector<ConfigReader::ScenarioConfig> ConfigReader::parseScenarios(
    UnitConvention unit_system) const {
    std::vector<ScenarioConfig> scenarios;

    for (const auto& section : getSectionsMatching(SCENARIO_PREFIX)) {
        scenarios.push_back(parseScenario(section, unit_system));
    }

    return scenarios;
}

bool ConfigReader::parseSweepConfig(SweepConfig& config) const {
    if (!hasSection(SWEEP_SECTION)) return false;

    config.enabled = getBool(SWEEP_SECTION, "enable", true);
    config.base_scenario = getString(SWEEP_SECTION, "base", "");
    config.parameter = getString(SWEEP_SECTION, "parameter", "air_freezing_index");
    config.start = getDouble(SWEEP_SECTION, "start", 0.0);
    config.stop = getDouble(SWEEP_SECTION, "stop", 0.0);
    config.count = getInt(SWEEP_SECTION, "count", 10);
    config.values = getDoubleArray(SWEEP_SECTION, "values");
    if (!config.values.empty()) {
        config.count = static_cast<int>(config.values.size());
    }

    return true;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);

    file << "# MBFD Configuration File\n";
    file << "# Modified Berggren frost depth, UFC 3-130-06 closed form\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value [unit]\n";
    file << "# Values without a unit are read in the declared unit system\n\n";

    file << "[OPTIONS]\n";
    file << "unit_system = IMPERIAL                # IMPERIAL (ft, lbm, BTU, degF) or METRIC\n";
    file << "lambda_method = ALDRICH               # ALDRICH, LOW_LATITUDE, MEAN\n";
    file << "surface_temperature_mode = SEASONAL   # SEASONAL or MULTIYEAR\n";
    file << "round_intermediates = true            # worksheet rounding of L, C, mu, alpha\n";
    file << "output_file = frost_depth_summary.csv\n";
    file << "print_intermediates = true\n\n";

    file << "[SCENARIO_example]\n";
    file << "thermal_conductivity = 0.78           # BTU/(hr-ft-degF), frozen/unfrozen average\n";
    file << "dry_density = 100.0                   # lbm/ft3\n";
    file << "water_content = 15 %                  # fraction unless '%' is given\n";
    file << "mean_annual_temperature_difference = 5.0   # degF above freezing (v0)\n";
    file << "# mean_annual_ground_temperature = 37 degF  # alternative to the differential\n";
    file << "air_freezing_index = 2500             # degF-day\n";
    file << "n_factor = 0.75                       # air to surface index\n";
    file << "freezing_season_duration = 160        # day\n";
    file << "mean_annual_air_temperature = 27 degF # MULTIYEAR mode only\n\n";

    file << "# [SWEEP]\n";
    file << "# base = SCENARIO_example\n";
    file << "# parameter = air_freezing_index\n";
    file << "# start = 500\n";
    file << "# stop = 4000\n";
    file << "# count = 8\n";
    file << "# values = 1000, 2000, 3500     # explicit list instead of start/stop/count\n";
}

// =============================================================================
// Utility Methods
// =============================================================================

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& pair : data) {
        if (pair.first.find(prefix) == 0) {
            result.push_back(pair.first);
        }
    }
    return result;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Merge data - other file values override existing
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto fail = [&result](const std::string& message) {
        result.errors.push_back(message);
        result.valid = false;
    };

    UnitConvention unit_system = UnitConvention::IMPERIAL;
    SurfaceTemperatureMode mode = SurfaceTemperatureMode::SEASONAL;

    if (!hasSection(OPTIONS_SECTION)) {
        result.warnings.push_back("No [OPTIONS] section found - using defaults");
    } else {
        try {
            unit_system = parseUnitConvention(getString(OPTIONS_SECTION, "unit_system", "IMPERIAL"));
        } catch (const std::invalid_argument& e) {
            fail(e.what());
        }
        try {
            parseLambdaMethod(getString(OPTIONS_SECTION, "lambda_method", "ALDRICH"));
        } catch (const std::invalid_argument& e) {
            fail(e.what());
        }
        try {
            mode = parseSurfaceTemperatureMode(
                getString(OPTIONS_SECTION, "surface_temperature_mode", "SEASONAL"));
        } catch (const std::invalid_argument& e) {
            fail(e.what());
        }
    }

    auto scenarios = getSectionsMatching(SCENARIO_PREFIX);
    if (scenarios.empty()) {
        fail("No [SCENARIO] section found");
    }

    static const char* const required[] = {
        "thermal_conductivity", "dry_density", "water_content",
        "air_freezing_index", "n_factor", "freezing_season_duration"
    };

    for (const auto& section : scenarios) {
        for (const char* key : required) {
            if (!hasKey(section, key)) {
                fail("[" + section + "] missing required key '" + key + "'");
            }
        }

        int ground_keys = 0;
        for (const char* key : GROUND_TEMPERATURE_KEYS) {
            if (hasKey(section, key)) ground_keys++;
        }
        if (ground_keys == 0) {
            fail("[" + section + "] needs mean_annual_temperature_difference "
                 "or mean_annual_ground_temperature");
        } else if (ground_keys > 1) {
            result.warnings.push_back("[" + section + "] several ground temperatures given - "
                                      "using the first of difference, temperature, ground");
        }

        if (mode == SurfaceTemperatureMode::MULTIYEAR &&
            !hasKey(section, "mean_annual_air_temperature")) {
            fail("[" + section + "] MULTIYEAR mode needs mean_annual_air_temperature");
        }

        for (const auto& key_val : getSectionData(section)) {
            if (key_val.first == "name") continue;
            std::string target = unitForKey(key_val.first, unit_system);
            if (target.empty()) {
                result.warnings.push_back("[" + section + "] unknown key '" +
                                          key_val.first + "' ignored");
                continue;
            }

            double value;
            std::string unit;
            if (!unit_system_.parseValueWithUnit(key_val.second, value, unit)) {
                fail("[" + section + "] " + key_val.first + " = '" + key_val.second +
                     "' is not a number");
                continue;
            }
            if (!unit.empty() && !unit_system_.areCompatible(unit, target)) {
                fail("[" + section + "] " + key_val.first + ": unit '" + unit +
                     "' is not compatible with " + target);
            }
        }
    }

    SweepConfig sweep;
    if (parseSweepConfig(sweep) && sweep.enabled) {
        if (!hasSection(sweep.base_scenario)) {
            fail("[SWEEP] base scenario '" + sweep.base_scenario + "' not found");
        }
        if (scenarioKeys().find(sweep.parameter) == scenarioKeys().end()) {
            fail("[SWEEP] unknown parameter '" + sweep.parameter + "'");
        }
        if (sweep.values.empty() && sweep.count < 2) {
            fail("[SWEEP] count must be at least 2");
        }
    }

    return result;
}

} // namespace MBFD
