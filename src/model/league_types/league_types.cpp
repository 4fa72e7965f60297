/// @file league_types.cpp
/// @brief Keyed lookup helpers for per-team maps.

#include "lsim/model/league_types.hpp"

namespace lsim::model {

foundation::SimResult<double> lookupTeam(const TeamValues& values,
                                         const TeamName& team,
                                         std::string_view what) {
    auto it = values.find(team);
    if (it == values.end()) {
        return foundation::SimResult<double>::err(foundation::SimError(
            foundation::ErrorCode::TeamNotFound,
            std::string("team '") + team + "' missing from " + std::string(what),
            team));
    }
    return foundation::SimResult<double>::ok(it->second);
}

} // namespace lsim::model
