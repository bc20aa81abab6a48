#pragma once

#include "shipem/emissionconfiguration.h"
#include "outputwriters.h"
#include "shipem/runconfiguration.h"

#include <vector>

namespace shipem {

class RunSummary;

/* Calculates the emissions of all the activities (tracks and moorings) of a vessel
 * The summary only receives the vessel results when every activity succeeded, a vessel that fails
 * is recorded as a failure without tracks or emissions and an empty result is returned.
 * A vessel whose attributes can not be guessed is a vessel failure, a ConfigurationError
 * raised while calculating the emissions is rethrown. */
std::vector<EmissionOutputEntry> calculate_vessel_emissions(const VesselInput& input, const EmissionConfiguration& emissionConfig, const RunConfiguration& cfg, RunSummary& summary);

}
