#include "UnitSystem.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace MBFD {

namespace {

// Exact definitions (NIST SP 811)
constexpr double FOOT = 0.3048;                     // m
constexpr double POUND_MASS = 0.45359237;           // kg
constexpr double CUBIC_FOOT = FOOT * FOOT * FOOT;   // m3
constexpr double BTU_IT = 1055.05585262;            // J
constexpr double RANKINE = 5.0 / 9.0;               // K
constexpr double HOUR = 3600.0;                     // s
constexpr double DAY = 86400.0;                     // s

} // namespace

// =============================================================================
// Dimension Implementation
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    bool first = true;

    auto append = [&](const char* symbol, double exponent) {
        if (std::abs(exponent) < 1e-10) return;
        if (!first) ss << " ";
        ss << symbol;
        if (std::abs(exponent - 1.0) > 1e-10) ss << "^" << exponent;
        first = false;
    };

    append("L", L);
    append("M", M);
    append("T", T);
    append("Theta", Theta);

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// UnitSystem Implementation
// =============================================================================

UnitSystem::UnitSystem() {
    initializeDatabase();
}

void UnitSystem::initializeDatabase() {
    addLengthUnits();
    addMassUnits();
    addTimeUnits();
    addVolumeUnits();
    addDensityUnits();
    addEnergyUnits();
    addTemperatureUnits();
    addTemperatureDifferenceUnits();
    addDegreeTimeUnits();
    addThermalUnits();
    addFractionUnits();
}

// =============================================================================
// Length Units
// =============================================================================

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0, 0);

    // Metric
    registerUnit(Unit("meter", "m", length, 1.0, "length", {"meters", "metre"}));
    registerUnit(Unit("centimeter", "cm", length, 0.01, "length"));
    registerUnit(Unit("millimeter", "mm", length, 0.001, "length"));
    registerUnit(Unit("kilometer", "km", length, 1000.0, "length"));

    // Imperial/US
    registerUnit(Unit("foot", "ft", length, FOOT, "length", {"feet"}));
    registerUnit(Unit("inch", "in", length, 0.0254, "length", {"inches"}));
    registerUnit(Unit("yard", "yd", length, 0.9144, "length"));
}

// =============================================================================
// Mass Units
// =============================================================================

void UnitSystem::addMassUnits() {
    Dimension mass(0, 1, 0);

    registerUnit(Unit("kilogram", "kg", mass, 1.0, "mass"));
    registerUnit(Unit("gram", "g", mass, 0.001, "mass"));
    registerUnit(Unit("tonne", "tonne", mass, 1000.0, "mass"));
    registerUnit(Unit("pound mass", "lbm", mass, POUND_MASS, "mass", {"lb"}));
}

// =============================================================================
// Time Units
// =============================================================================

void UnitSystem::addTimeUnits() {
    Dimension time(0, 0, 1);

    registerUnit(Unit("second", "s", time, 1.0, "time"));
    registerUnit(Unit("minute", "min", time, 60.0, "time"));
    registerUnit(Unit("hour", "hr", time, HOUR, "time", {"h", "hours"}));
    registerUnit(Unit("day", "day", time, DAY, "time", {"days", "d"}));
    registerUnit(Unit("week", "week", time, 7.0 * DAY, "time", {"weeks"}));
    registerUnit(Unit("year", "year", time, 365.0 * DAY, "time", {"years"}));
}

// =============================================================================
// Volume Units
// =============================================================================

void UnitSystem::addVolumeUnits() {
    Dimension volume(3, 0, 0);

    registerUnit(Unit("cubic meter", "m3", volume, 1.0, "volume"));
    registerUnit(Unit("cubic centimeter", "cm3", volume, 1e-6, "volume"));
    registerUnit(Unit("liter", "L", volume, 0.001, "volume"));
    registerUnit(Unit("cubic foot", "ft3", volume, CUBIC_FOOT, "volume"));
    registerUnit(Unit("cubic yard", "yd3", volume, 0.764554857984, "volume"));
}

// =============================================================================
// Density Units
// =============================================================================

void UnitSystem::addDensityUnits() {
    Dimension density(-3, 1, 0);

    registerUnit(Unit("kilogram per cubic meter", "kg/m3", density, 1.0, "density"));
    registerUnit(Unit("gram per cubic centimeter", "g/cm3", density, 1000.0, "density"));
    registerUnit(Unit("tonne per cubic meter", "t/m3", density, 1000.0, "density",
                      {"Mg/m3"}));
    registerUnit(Unit("pound mass per cubic foot", "lbm/ft3", density,
                      POUND_MASS / CUBIC_FOOT, "density", {"pcf", "lb/ft3"}));
}

// =============================================================================
// Energy Units
// =============================================================================

void UnitSystem::addEnergyUnits() {
    Dimension energy(2, 1, -2);

    registerUnit(Unit("joule", "J", energy, 1.0, "energy"));
    registerUnit(Unit("kilojoule", "kJ", energy, 1e3, "energy"));
    registerUnit(Unit("megajoule", "MJ", energy, 1e6, "energy"));
    registerUnit(Unit("british thermal unit", "BTU", energy, BTU_IT, "energy", {"Btu"}));

    // Energy per unit volume (volumetric latent heat)
    Dimension volumetric_energy(-1, 1, -2);
    registerUnit(Unit("joule per cubic meter", "J/m3", volumetric_energy, 1.0,
                      "volumetric_energy"));
    registerUnit(Unit("kilojoule per cubic meter", "kJ/m3", volumetric_energy, 1e3,
                      "volumetric_energy"));
    registerUnit(Unit("megajoule per cubic meter", "MJ/m3", volumetric_energy, 1e6,
                      "volumetric_energy"));
    registerUnit(Unit("BTU per cubic foot", "BTU/ft3", volumetric_energy,
                      BTU_IT / CUBIC_FOOT, "volumetric_energy"));

    // Energy per unit mass (latent heat of fusion of water)
    Dimension specific_energy(2, 0, -2);
    registerUnit(Unit("joule per kilogram", "J/kg", specific_energy, 1.0,
                      "specific_energy"));
    registerUnit(Unit("kilojoule per kilogram", "kJ/kg", specific_energy, 1e3,
                      "specific_energy"));
    registerUnit(Unit("BTU per pound mass", "BTU/lbm", specific_energy,
                      BTU_IT / POUND_MASS, "specific_energy", {"BTU/lb"}));
}

// =============================================================================
// Temperature Units
// =============================================================================

void UnitSystem::addTemperatureUnits() {
    Dimension temperature(0, 0, 0, 1);

    // Absolute temperatures
    registerUnit(Unit("kelvin", "K", temperature, 1.0, "temperature"));
    registerUnit(Unit("rankine", "R", temperature, RANKINE, "temperature"));

    // Relative temperatures (with offset)
    Unit celsius("celsius", "degC", temperature, 1.0, "temperature");
    celsius.offset = 273.15;  // 0 degC = 273.15 K
    registerUnit(celsius);

    Unit fahrenheit("fahrenheit", "degF", temperature, RANKINE, "temperature");
    fahrenheit.offset = 459.67;  // 0 degF = 459.67 R
    registerUnit(fahrenheit);
}

void UnitSystem::addTemperatureDifferenceUnits() {
    Dimension temperature(0, 0, 0, 1);

    registerUnit(Unit("kelvin difference", "delta_K", temperature, 1.0,
                      "temperature_difference", {"dK"}));
    registerUnit(Unit("celsius difference", "delta_degC", temperature, 1.0,
                      "temperature_difference", {"dC", "Cdeg"}));
    registerUnit(Unit("fahrenheit difference", "delta_degF", temperature, RANKINE,
                      "temperature_difference", {"dF", "Fdeg"}));
}

// =============================================================================
// Degree-Time Units (freezing and thawing indices)
// =============================================================================

void UnitSystem::addDegreeTimeUnits() {
    Dimension degree_time(0, 0, 1, 1);

    registerUnit(Unit("kelvin second", "K-s", degree_time, 1.0, "degree_time"));
    registerUnit(Unit("celsius degree day", "degC-day", degree_time, DAY, "degree_time",
                      {"degC-days", "Cday", "C-day"}));
    registerUnit(Unit("fahrenheit degree day", "degF-day", degree_time, RANKINE * DAY,
                      "degree_time", {"degF-days", "Fday", "F-day"}));
    registerUnit(Unit("celsius degree hour", "degC-hr", degree_time, HOUR, "degree_time"));
    registerUnit(Unit("fahrenheit degree hour", "degF-hr", degree_time, RANKINE * HOUR,
                      "degree_time"));
}

// =============================================================================
// Thermal Units
// =============================================================================

void UnitSystem::addThermalUnits() {
    // Thermal conductivity: W/(m·K) = kg·m/(s³·K)
    Dimension thermal_cond(1, 1, -3, -1);
    registerUnit(Unit("watt per meter kelvin", "W/(m-K)", thermal_cond, 1.0,
                      "thermal_conductivity", {"W/m/K", "W/(m*K)"}));
    registerUnit(Unit("BTU per hour foot fahrenheit", "BTU/(hr-ft-degF)", thermal_cond,
                      BTU_IT / (HOUR * FOOT * RANKINE), "thermal_conductivity",
                      {"BTU/(ft-hr-degF)", "BTU/hr/ft/degF"}));

    // Volumetric heat capacity: J/(m³·K) = kg/(m·s²·K)
    Dimension vol_heat_cap(-1, 1, -2, -1);
    registerUnit(Unit("joule per cubic meter kelvin", "J/(m3-K)", vol_heat_cap, 1.0,
                      "volumetric_heat_capacity"));
    registerUnit(Unit("megajoule per cubic meter kelvin", "MJ/(m3-K)", vol_heat_cap, 1e6,
                      "volumetric_heat_capacity"));
    registerUnit(Unit("BTU per cubic foot fahrenheit", "BTU/(ft3-degF)", vol_heat_cap,
                      BTU_IT / (CUBIC_FOOT * RANKINE), "volumetric_heat_capacity"));

    // Specific heat: J/(kg·K) = m²/(s²·K)
    Dimension heat_cap(2, 0, -2, -1);
    registerUnit(Unit("joule per kilogram kelvin", "J/(kg-K)", heat_cap, 1.0,
                      "specific_heat"));
    registerUnit(Unit("kilojoule per kilogram kelvin", "kJ/(kg-K)", heat_cap, 1e3,
                      "specific_heat"));
    registerUnit(Unit("BTU per pound fahrenheit", "BTU/(lbm-degF)", heat_cap,
                      BTU_IT / (POUND_MASS * RANKINE), "specific_heat"));
}

// =============================================================================
// Fraction Units (water content, n-factor)
// =============================================================================

void UnitSystem::addFractionUnits() {
    Dimension none(0, 0, 0);

    registerUnit(Unit("fraction", "fraction", none, 1.0, "fraction", {"-"}));
    registerUnit(Unit("percent", "%", none, 0.01, "fraction", {"pct"}));
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    // Store by name (lowercase)
    std::string key = toLowerCase(unit.name);
    units_[key] = unit;

    // Store by symbol (case-sensitive primary, lowercase secondary)
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
        units_[toLowerCase(unit.symbol)] = unit;
    }

    for (const auto& alias : unit.aliases) {
        units_[alias] = unit;
        units_[toLowerCase(alias)] = unit;
    }

    if (!unit.category.empty()) {
        categories_[unit.category].push_back(key);
    }
}

std::string UnitSystem::toLowerCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string UnitSystem::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    // Exact match first: "K" and "k" style collisions resolve case-sensitively
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    it = units_.find(toLowerCase(name_or_symbol));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

std::vector<std::string> UnitSystem::getCategories() const {
    std::vector<std::string> result;
    for (const auto& pair : categories_) {
        result.push_back(pair.first);
    }
    return result;
}

Dimension UnitSystem::getDimension(const std::string& unit_name) const {
    const Unit* unit = getUnit(unit_name);
    if (unit) {
        return unit->dimension;
    }
    throw std::runtime_error("Unit not found: " + unit_name);
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);

    if (!from) {
        throw std::runtime_error("Unknown source unit: " + from_unit);
    }
    if (!to) {
        throw std::runtime_error("Unknown destination unit: " + to_unit);
    }

    if (from->dimension != to->dimension) {
        throw std::runtime_error("Incompatible dimensions: " +
                                 from->dimension.toString() + " vs " +
                                 to->dimension.toString());
    }

    // Convert: from_unit -> base -> to_unit
    double base_value = from->convertToBase(value);
    return to->convertFromBase(base_value);
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + from_unit);
    }
    return unit->convertToBase(value);
}

double UnitSystem::fromBase(double value, const std::string& to_unit) const {
    const Unit* unit = getUnit(to_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + to_unit);
    }
    return unit->convertFromBase(value);
}

// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    // Find where the number ends and unit begins
    size_t i = 0;

    if (trimmed[i] == '+' || trimmed[i] == '-') i++;

    bool has_digits = false;
    bool has_decimal = false;
    while (i < trimmed.length()) {
        if (std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            has_digits = true;
            i++;
        } else if (trimmed[i] == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else if ((trimmed[i] == 'e' || trimmed[i] == 'E') && has_digits &&
                   i + 1 < trimmed.length() &&
                   (std::isdigit(static_cast<unsigned char>(trimmed[i + 1])) ||
                    trimmed[i + 1] == '+' || trimmed[i + 1] == '-')) {
            // Scientific notation
            i++;
            if (trimmed[i] == '+' || trimmed[i] == '-') {
                i++;
            }
        } else {
            break;
        }
    }

    if (!has_digits) return false;

    std::string num_str = trim(trimmed.substr(0, i));
    std::string unit_str = trim(trimmed.substr(i));

    try {
        value = std::stod(num_str);
    } catch (const std::exception&) {
        return false;
    }
    unit = unit_str;
    return true;
}

double UnitSystem::parseAndConvertToBase(const std::string& value_with_unit) const {
    double value;
    std::string unit;

    if (!parseValueWithUnit(value_with_unit, value, unit)) {
        throw std::runtime_error("Failed to parse: " + value_with_unit);
    }

    if (unit.empty()) {
        // No unit specified, assume base SI
        return value;
    }

    return toBase(value, unit);
}

// =============================================================================
// Dimensional Analysis
// =============================================================================

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* u1 = getUnit(unit1);
    const Unit* u2 = getUnit(unit2);

    if (!u1 || !u2) return false;
    return u1->dimension == u2->dimension;
}

std::string UnitSystem::getBaseUnit(const Dimension& dim) const {
    std::stringstream ss;
    bool first = true;

    auto append = [&](const char* symbol, double exponent) {
        if (std::abs(exponent) < 1e-10) return;
        if (!first) ss << " ";
        ss << symbol;
        if (std::abs(exponent - 1.0) > 1e-10) ss << "^" << exponent;
        first = false;
    };

    append("m", dim.L);
    append("kg", dim.M);
    append("s", dim.T);
    append("K", dim.Theta);

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// Custom Units
// =============================================================================

void UnitSystem::addUnit(const Unit& unit) {
    registerUnit(unit);
}

// =============================================================================
// Utility Functions
// =============================================================================

std::string UnitSystem::formatValue(double value, const std::string& unit,
                                    int precision) const {
    std::stringstream ss;
    ss << std::setprecision(precision) << value << " " << unit;
    return ss.str();
}

void UnitSystem::printDatabase(std::ostream& os) const {
    os << "Unit System Database\n";
    os << "====================\n\n";

    for (const auto& cat_pair : categories_) {
        os << "Category: " << cat_pair.first << "\n";
        os << std::string(40, '-') << "\n";

        for (const auto& unit_name : cat_pair.second) {
            auto it = units_.find(unit_name);
            if (it != units_.end()) {
                const Unit& u = it->second;
                os << std::setw(32) << std::left << u.name
                   << " [" << std::setw(16) << u.symbol << "] "
                   << " = " << u.to_base << " * base SI"
                   << " (" << u.dimension.toString() << ")\n";
            }
        }
        os << "\n";
    }
}

} // namespace MBFD
