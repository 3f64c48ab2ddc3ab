#ifndef MBFD_CONFIG_READER_HPP
#define MBFD_CONFIG_READER_HPP

#include "FrostDepthModel.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace MBFD {

/**
 * @brief INI-style configuration reader for frost depth runs
 *
 * A file holds an [OPTIONS] section, any number of scenario sections
 * ([SCENARIO] or [SCENARIO_<name>]) and an optional [SWEEP] section.
 * Numeric values may carry a unit suffix ("1.35 W/(m-K)", "15 %",
 * "37 degF"); suffixed values are converted into the declared unit system,
 * plain values are taken as already expressed in it.
 */
class ConfigReader {
public:
    // =========================================================================
    // Nested Struct Definitions
    // =========================================================================

    struct RunOptions {
        UnitConvention unit_system;
        FrostDepthCalculator::Options calculator;
        std::string output_file;          // CSV summary, empty for console only
        bool print_intermediates;

        RunOptions() :
            unit_system(UnitConvention::IMPERIAL),
            output_file("frost_depth_summary.csv"),
            print_intermediates(true) {}
    };

    struct ScenarioConfig {
        std::string name;
        FrostDepthInput input;
    };

    /**
     * @brief Sweep of one input over a base scenario
     *
     * Either an explicit list of values or count points spaced linearly
     * from start to stop.
     */
    struct SweepConfig {
        bool enabled;
        std::string base_scenario;        // section name of the base scenario
        std::string parameter;            // scenario key to vary
        double start;                     // in the declared unit system
        double stop;
        int count;
        std::vector<double> values;       // explicit values, override start/stop/count

        SweepConfig() : enabled(false), start(0.0), stop(0.0), count(0) {}
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    // =========================================================================
    // Constructor/Destructor
    // =========================================================================

    ConfigReader();
    ~ConfigReader() = default;

    bool loadFile(const std::string& filename);

    /**
     * @brief Load configuration text already held in memory
     */
    bool loadString(const std::string& contents);

    // =========================================================================
    // Parsing Methods
    // =========================================================================

    bool parseRunOptions(RunOptions& options) const;

    /**
     * @brief Parse every section whose name starts with "SCENARIO"
     * @param unit_system Unit system the scenario values are expressed in
     */
    std::vector<ScenarioConfig> parseScenarios(UnitConvention unit_system) const;

    /**
     * @brief Parse one scenario section
     */
    ScenarioConfig parseScenario(const std::string& section, UnitConvention unit_system) const;

    bool parseSweepConfig(SweepConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    // =========================================================================
    // Unit-Aware Value Accessors
    // =========================================================================

    /**
     * @brief Get double value expressed in a target unit
     * @param default_val Default value (already in target_unit)
     * @param target_unit Unit the value is returned in; a plain value
     *        without suffix is assumed to be in this unit
     * @return Converted value, or default_val when missing or unconvertible
     */
    double getDoubleInUnit(const std::string& section, const std::string& key,
                           double default_val, const std::string& target_unit) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

    /**
     * @brief Scenario keys that may be swept, with their unit category
     */
    static const std::map<std::string, std::string>& scenarioKeys();

    /**
     * @brief Store a scenario key's value (in input.unit_system) into an input record
     * @throws std::invalid_argument for keys not listed by scenarioKeys()
     */
    static void applyScenarioValue(FrostDepthInput& input, const std::string& key, double value);

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    UnitSystem unit_system_;

    bool parseStream(std::istream& in);
    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
    std::string unitForKey(const std::string& key, UnitConvention unit_system) const;
};

} // namespace MBFD

#endif // MBFD_CONFIG_READER_HPP
