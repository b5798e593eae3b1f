#pragma once

#include "turf/domain/engine_config.hpp"
#include "turf/model/i_race_model.hpp"

#include <memory>

namespace turf {

// Builds the model variant named by config.variant. Throws ConfigError on
// an invalid configuration.
std::unique_ptr<IRaceModel> makeRaceModel(const domain::ModelConfig& config);

}  // namespace turf
