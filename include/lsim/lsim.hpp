#pragma once

/// @file lsim.hpp
/// @brief Aggregate header for the league simulator library.

#include "lsim/version.hpp"

#include "lsim/foundation/config_manager.hpp"
#include "lsim/foundation/error_code.hpp"
#include "lsim/foundation/sim_error.hpp"
#include "lsim/foundation/sim_logger.hpp"
#include "lsim/foundation/sim_result.hpp"

#include "lsim/model/elo_updater.hpp"
#include "lsim/model/league_goal_model.hpp"
#include "lsim/model/league_statistics.hpp"
#include "lsim/model/league_types.hpp"
#include "lsim/model/outcome_probability.hpp"
#include "lsim/model/rating_initializer.hpp"
#include "lsim/model/result_classifier.hpp"
#include "lsim/model/standings_validator.hpp"

#include "lsim/simulation/goal_simulator.hpp"
#include "lsim/simulation/random_source.hpp"

#include "lsim/season/season_simulator.hpp"
#include "lsim/season/simulator_config.hpp"
