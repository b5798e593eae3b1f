#include "turf/model/race_model_factory.hpp"
#include "turf/errors.hpp"
#include "turf/model/plackett_luce_model.hpp"
#include "turf/model/softmax_win_model.hpp"

namespace turf {

std::unique_ptr<IRaceModel> makeRaceModel(const domain::ModelConfig& config) {
  switch (config.variant) {
    case domain::ModelVariant::Softmax:
      return std::make_unique<SoftmaxWinModel>(config);
    case domain::ModelVariant::PlackettLuce:
      return std::make_unique<PlackettLuceModel>(config);
  }
  throw ConfigError("unknown model variant");
}

}  // namespace turf
