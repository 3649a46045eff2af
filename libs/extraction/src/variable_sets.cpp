/**
 * @file variable_sets.cpp
 * @brief Per-domain variable sets.
 * @author Watosn
 */

#include "resx/extraction/variable_sets.hpp"

#include <fmt/format.h>

namespace resx::extraction {

VariableSet default_variables(resx::core::Domain domain) {
  switch (domain) {
    case resx::core::Domain::Solar:
      return VariableSet{
          .variables = {"dhi", "dni", "ghi", "air_temperature", "wind_speed", "surface_albedo"}, .strict = false};
    case resx::core::Domain::Nsrdb:
      return VariableSet{.variables = {"dhi", "dni", "ghi", "dew_point", "air_temperature", "surface_pressure",
                                       "wind_speed", "wind_direction", "surface_albedo"},
                         .strict = false};
    case resx::core::Domain::Wave:
      return VariableSet{
          .variables = {"significant_wave_height", "energy_period", "mean_wave_direction"}, .strict = false};
    case resx::core::Domain::Wind:
    case resx::core::Domain::Generic:
      break;
  }
  return VariableSet{.strict = false};
}

VariableSet wind_variables(int hub_height_m) {
  return VariableSet{.bundle_prefix = fmt::format("SAM_{}m", hub_height_m),
                     .variables = {fmt::format("windspeed_{}m", hub_height_m),
                                   fmt::format("winddirection_{}m", hub_height_m),
                                   fmt::format("temperature_{}m", hub_height_m),
                                   fmt::format("pressure_{}m", hub_height_m)},
                     .strict = false};
}

std::string bundle_name(const std::string& prefix, resx::core::SiteId site_id) {
  return fmt::format("{}-{}", prefix, site_id);
}

}  // namespace resx::extraction
