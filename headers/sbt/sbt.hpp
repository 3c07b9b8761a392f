//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef SCANBUILDTRACKER_SBT_HPP
#define SCANBUILDTRACKER_SBT_HPP

/**
 * @file sbt.hpp
 * @brief Main header for the Scan-Build Tracker library.
 *
 * Pulls in the core types. Include the component headers under
 * reports/, history/, archive/ and publisher/ for the engine itself.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "diagnostics.hpp"

#endif //SCANBUILDTRACKER_SBT_HPP
