#include "playfield/core/constants.hpp"

namespace PlayfieldConstants {

    const double Pi = 3.14159265358979323846;

    // Display
    const unsigned int ScreenWidth    = 960;
    const unsigned int ScreenHeight   = 600;
    const unsigned int StepsPerSecond = 60;

    const double DefaultGravityMagnitude = 980.0;
    const double DefaultDirectionalPower = 1000.0;

    std::vector<ScenarioType> getAllScenarios() {
        return {
            ScenarioType::PLAYGROUND,
            ScenarioType::STAIRS
        };
    }

    std::string getScenarioName(ScenarioType scenario) {
        switch (scenario) {
            case ScenarioType::PLAYGROUND: return "PLAYGROUND";
            case ScenarioType::STAIRS:     return "STAIRS";
            default: return "UNKNOWN";
        }
    }

} // namespace PlayfieldConstants
