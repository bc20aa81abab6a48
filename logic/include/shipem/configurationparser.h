#pragma once

#include "shipem/criterion.h"
#include "shipem/emissionconfiguration.h"
#include "infra/filesystem.h"

#include <string_view>

namespace shipem {

EmissionConfiguration parse_emission_configuration_file(const fs::path& config);
EmissionConfiguration parse_emission_configuration(std::string_view configContents); // used for testing

// Parses the criteria of a rule: scalar (equal to), { ge = x, lt = y } (range) or { any_of = [...] }
MatchCriteria parse_match_criteria(std::string_view tomlInlineTable);

}
