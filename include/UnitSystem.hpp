#ifndef MBFD_UNIT_SYSTEM_HPP
#define MBFD_UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <ostream>
#include <stdexcept>
#include <cmath>

namespace MBFD {

/**
 * @brief Unit dimension in terms of Length, Mass, Time, Temperature (L M T Θ)
 *
 * Every quantity handled by the frost depth engine can be expressed as a
 * combination of fundamental dimensions: Length^a * Mass^b * Time^c * Θ^d
 */
struct Dimension {
    double L;      // Length exponent
    double M;      // Mass exponent
    double T;      // Time exponent
    double Theta;  // Temperature exponent

    Dimension(double length = 0, double mass = 0, double time = 0, double temperature = 0)
        : L(length), M(mass), T(time), Theta(temperature) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(M - other.M) < 1e-10 &&
                std::abs(T - other.T) < 1e-10 &&
                std::abs(Theta - other.Theta) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    // Get human-readable dimension string
    std::string toString() const;
};

/**
 * @brief Unit definition with conversion factor to base SI units
 *
 * Base SI units are:
 * - Length: meter (m)
 * - Mass: kilogram (kg)
 * - Time: second (s)
 * - Temperature: kelvin (K)
 */
struct Unit {
    std::string name;           // Full name (e.g., "meter")
    std::string symbol;         // Short symbol (e.g., "m")
    Dimension dimension;        // Dimensional formula
    double to_base;             // Conversion factor to base SI units
    double offset;              // Offset for affine conversions (absolute temperature only)
    std::string category;       // Category for organization
    std::vector<std::string> aliases;  // Alternative names/symbols

    Unit() : to_base(1.0), offset(0.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "")
        : name(n), symbol(s), dimension(d), to_base(factor), offset(0.0), category(cat) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat,
         const std::vector<std::string>& alias_list)
        : name(n), symbol(s), dimension(d), to_base(factor), offset(0.0),
          category(cat), aliases(alias_list) {}

    // Convert value from this unit to base SI
    double convertToBase(double value) const {
        return (value + offset) * to_base;
    }

    // Convert value from base SI to this unit
    double convertFromBase(double value) const {
        return value / to_base - offset;
    }
};

/**
 * @brief Unit database with conversion utilities for soil thermal work
 *
 * Covers the quantities that enter a modified Berggren frost depth
 * computation in either the UFC imperial convention (BTU, lbm, ft, degF)
 * or the metric convention (J, kg, m, degC):
 * - Conversion between any compatible units
 * - Dimensional analysis and validation
 * - Parsing of unit strings (e.g., "100 lbm/ft3", "2500 degF-day", "15 %")
 *
 * Absolute temperatures (degC, degF) carry an offset. Temperature
 * differences (delta_degC, delta_degF) and degree-day products do not, so
 * thermal ratios and freezing indices must always use the delta forms.
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Get unit by name or symbol
     * @param name_or_symbol Unit name or symbol (case-insensitive fallback)
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    bool hasUnit(const std::string& name_or_symbol) const;

    /**
     * @brief Get all units in a category
     * @param category Category name (e.g., "density", "thermal_conductivity")
     */
    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;

    std::vector<std::string> getCategories() const;

    /**
     * @brief Get dimension for a unit
     * @throws std::runtime_error if the unit is unknown
     */
    Dimension getDimension(const std::string& unit_name) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws std::runtime_error if a unit is unknown or dimensions differ
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    double toBase(double value, const std::string& from_unit) const;
    double fromBase(double value, const std::string& to_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Split a string such as "0.78 BTU/(hr-ft-degF)" into value and unit
     * @param[out] value Parsed numeric value (not converted)
     * @param[out] unit Unit string, empty when none was given
     * @return true if a number was found
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    /**
     * @brief Parse value with unit and convert to base SI
     */
    double parseAndConvertToBase(const std::string& value_with_unit) const;

    // =========================================================================
    // Dimensional Analysis
    // =========================================================================

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    /**
     * @brief Get base SI unit string for a given dimension (e.g. "m^-1 kg s^-3 K^-1")
     */
    std::string getBaseUnit(const Dimension& dim) const;

    // =========================================================================
    // Custom Unit Registration
    // =========================================================================

    void addUnit(const Unit& unit);

    // =========================================================================
    // Utility Functions
    // =========================================================================

    std::string formatValue(double value, const std::string& unit,
                            int precision = 6) const;

    /**
     * @brief Print unit database to stream (for documentation)
     */
    void printDatabase(std::ostream& os) const;

private:
    // Unit database: maps name/symbol -> Unit
    std::map<std::string, Unit> units_;

    // Category index: category -> list of unit names
    std::map<std::string, std::vector<std::string>> categories_;

    void initializeDatabase();

    void addLengthUnits();
    void addMassUnits();
    void addTimeUnits();
    void addVolumeUnits();
    void addDensityUnits();
    void addEnergyUnits();
    void addTemperatureUnits();
    void addTemperatureDifferenceUnits();
    void addDegreeTimeUnits();
    void addThermalUnits();
    void addFractionUnits();

    void registerUnit(const Unit& unit);

    std::string toLowerCase(const std::string& str) const;
    std::string trim(const std::string& str) const;
};

/**
 * @brief Global unit system instance (singleton pattern)
 *
 * The database is built once and only read afterwards, so the instance can
 * be shared by concurrent frost depth computations.
 */
class UnitSystemManager {
public:
    static const UnitSystem& getInstance() {
        static const UnitSystem instance;
        return instance;
    }

private:
    UnitSystemManager() = default;
};

// Convenience functions for quick access
inline double convertUnits(double value, const std::string& from, const std::string& to) {
    return UnitSystemManager::getInstance().convert(value, from, to);
}

inline double toSI(double value, const std::string& unit) {
    return UnitSystemManager::getInstance().toBase(value, unit);
}

inline double fromSI(double value, const std::string& unit) {
    return UnitSystemManager::getInstance().fromBase(value, unit);
}

} // namespace MBFD

#endif // MBFD_UNIT_SYSTEM_HPP
