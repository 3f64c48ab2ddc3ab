/**
 * @file unit_converter.cpp
 * @brief Command-line converter for soil thermal and frost depth units
 *
 * Usage:
 *   ./unit_converter <value> <from_unit> <to_unit>
 *   ./unit_converter --list [category]
 *   ./unit_converter --help
 *
 * Examples:
 *   ./unit_converter 0.78 "BTU/(hr-ft-degF)" "W/(m-K)"
 *   ./unit_converter 2500 degF-day degC-day
 *   ./unit_converter 37 degF degC
 *   ./unit_converter --list thermal_conductivity
 */

#include "UnitSystem.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>

using namespace MBFD;

void printHelp() {
    std::cout << "\n";
    std::cout << "MBFD Unit Converter\n";
    std::cout << "===================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  unit_converter <value> <from_unit> <to_unit>\n";
    std::cout << "  unit_converter --list [category]\n";
    std::cout << "  unit_converter --help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  unit_converter 0.78 \"BTU/(hr-ft-degF)\" \"W/(m-K)\"\n";
    std::cout << "  unit_converter 100 lbm/ft3 kg/m3\n";
    std::cout << "  unit_converter 2500 degF-day degC-day\n";
    std::cout << "  unit_converter 37 degF degC\n";
    std::cout << "  unit_converter 5 delta_degF delta_degC\n";
    std::cout << "  unit_converter --list\n\n";
    std::cout << "Common Units:\n";
    std::cout << "  Conductivity: W/(m-K), BTU/(hr-ft-degF)\n";
    std::cout << "  Density: kg/m3, lbm/ft3 (pcf)\n";
    std::cout << "  Latent heat: J/m3, BTU/ft3\n";
    std::cout << "  Heat capacity: J/(m3-K), BTU/(ft3-degF)\n";
    std::cout << "  Temperature: K, R, degC, degF\n";
    std::cout << "  Temperature difference: delta_K, delta_degC, delta_degF\n";
    std::cout << "  Freezing index: degC-day, degF-day\n";
    std::cout << "  Length: m, cm, mm, ft, in\n\n";
}

void listUnits(const UnitSystem& units, const std::string& category = "") {
    std::cout << "\n";

    if (category.empty()) {
        std::cout << "Available Unit Categories:\n";
        std::cout << "==========================\n\n";

        for (const auto& cat : units.getCategories()) {
            auto cat_units = units.getUnitsInCategory(cat);
            std::cout << std::setw(28) << std::left << cat
                      << " (" << cat_units.size() << " units)\n";
        }
        std::cout << "\nUse: unit_converter --list <category> to see units in a category\n\n";
        return;
    }

    auto cat_units = units.getUnitsInCategory(category);
    if (cat_units.empty()) {
        std::cout << "Category '" << category << "' not found.\n";
        std::cout << "Use: unit_converter --list to see available categories\n\n";
        return;
    }

    std::cout << "Units in category: " << category << "\n";
    std::cout << std::string(60, '=') << "\n\n";
    std::cout << std::setw(32) << std::left << "Name"
              << std::setw(18) << "Symbol"
              << "To SI Base\n";
    std::cout << std::string(60, '-') << "\n";

    for (const auto* unit : cat_units) {
        std::cout << std::setw(32) << std::left << unit->name
                  << std::setw(18) << unit->symbol
                  << std::scientific << std::setprecision(6) << unit->to_base;
        if (unit->offset != 0.0) {
            std::cout << " (offset: " << unit->offset << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

int performConversion(const UnitSystem& units, double value,
                      const std::string& from_unit,
                      const std::string& to_unit) {
    if (!units.hasUnit(from_unit)) {
        std::cerr << "Error: Unknown source unit '" << from_unit << "'\n";
        return 1;
    }
    if (!units.hasUnit(to_unit)) {
        std::cerr << "Error: Unknown destination unit '" << to_unit << "'\n";
        return 1;
    }

    if (!units.areCompatible(from_unit, to_unit)) {
        std::cerr << "Error: Incompatible units\n";
        std::cerr << "  " << from_unit << " has dimension: "
                  << units.getDimension(from_unit).toString() << "\n";
        std::cerr << "  " << to_unit << " has dimension: "
                  << units.getDimension(to_unit).toString() << "\n";
        return 1;
    }

    try {
        double result = units.convert(value, from_unit, to_unit);
        double si_value = units.toBase(value, from_unit);
        std::string si_unit = units.getBaseUnit(units.getDimension(from_unit));

        std::cout << "\n";
        std::cout << std::fixed << std::setprecision(6);
        std::cout << "  Input:   " << value << " " << from_unit << "\n";
        std::cout << "  Output:  " << result << " " << to_unit << "\n";
        std::cout << std::scientific << std::setprecision(6);
        std::cout << "  SI Base: " << si_value << " " << si_unit << "\n\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

int main(int argc, char* argv[]) {
    const UnitSystem& units = UnitSystemManager::getInstance();

    if (argc == 1 || (argc == 2 && strcmp(argv[1], "--help") == 0)) {
        printHelp();
        return 0;
    }

    if (argc >= 2 && strcmp(argv[1], "--list") == 0) {
        listUnits(units, argc == 2 ? "" : argv[2]);
        return 0;
    }

    if (argc != 4) {
        std::cerr << "Error: Invalid number of arguments\n";
        printHelp();
        return 1;
    }

    try {
        double value = std::stod(argv[1]);
        return performConversion(units, value, argv[2], argv[3]);
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: Invalid value '" << argv[1] << "'\n";
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: Value out of range\n";
        return 1;
    }
}
