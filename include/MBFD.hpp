#ifndef MBFD_HPP
#define MBFD_HPP

#include <petsc.h>

#include "UnitSystem.hpp"
#include "SoilThermalProperties.hpp"
#include "FrostDepthModel.hpp"
#include "ConfigReader.hpp"
#include "BatchRunner.hpp"
#include "SummaryOutput.hpp"

namespace MBFD {

constexpr const char* VERSION = "1.0.0";

// Version of UFC 3-130-06 whose closed-form worksheet is implemented
constexpr const char* UFC_REFERENCE = "UFC 3-130-06 (2004)";

} // namespace MBFD

#endif // MBFD_HPP
