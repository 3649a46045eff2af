/**
 * @file variable_sets.hpp
 * @brief Per-domain variable sets used to assemble site bundles.
 * @author Watosn
 */
#pragma once

#include <string>
#include <vector>

#include "resx/core/types.hpp"

namespace resx::extraction {

/**
 * @brief Variables gathered into one bundle and the bundle name prefix.
 *
 * With `strict` set every variable must exist in the collection. Otherwise
 * unavailable variables are dropped, as long as at least one remains.
 */
struct VariableSet {
  std::string bundle_prefix{"SAM"};
  std::vector<std::string> variables{};
  bool strict{true};
};

/**
 * @brief Default bundle variables of a domain (empty for `Domain::Generic`).
 */
[[nodiscard]] VariableSet default_variables(resx::core::Domain domain);

/**
 * @brief Wind variables at one hub height, e.g. `windspeed_100m`.
 */
[[nodiscard]] VariableSet wind_variables(int hub_height_m);

/**
 * @brief Bundle identifier, `<prefix>-<site id>`.
 */
[[nodiscard]] std::string bundle_name(const std::string& prefix, resx::core::SiteId site_id);

}  // namespace resx::extraction
