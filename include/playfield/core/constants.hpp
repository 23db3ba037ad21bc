#ifndef PLAYFIELD_CONSTANTS_HPP
#define PLAYFIELD_CONSTANTS_HPP

#include <string>
#include <vector>

namespace PlayfieldConstants {

    /**
     * @brief Scenarios the front end can switch between.
     */
    enum class ScenarioType {
        PLAYGROUND,
        STAIRS
    };

    // Truly global constants
    extern const double Pi;

    // Display
    extern const unsigned int ScreenWidth;
    extern const unsigned int ScreenHeight;
    extern const unsigned int StepsPerSecond;

    // Gameplay defaults
    extern const double DefaultGravityMagnitude;  ///< px/s^2, matches a 2D engine's project default
    extern const double DefaultDirectionalPower;  ///< Force applicator POWER

    std::vector<ScenarioType> getAllScenarios();
    std::string getScenarioName(ScenarioType scenario);

} // namespace PlayfieldConstants

#endif // PLAYFIELD_CONSTANTS_HPP
