//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef SCANBUILDTRACKER_VERSION_HPP
#define SCANBUILDTRACKER_VERSION_HPP

/**
 * @file version.hpp
 * @brief Scan-Build Tracker version information.
 */

namespace sbt {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Scan-Build Tracker";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "sbt";

}  // namespace sbt

#endif //SCANBUILDTRACKER_VERSION_HPP
