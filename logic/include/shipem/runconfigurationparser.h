#pragma once

#include "shipem/runconfiguration.h"
#include "infra/filesystem.h"

#include <string_view>

namespace shipem {

RunConfiguration parse_run_configuration_file(const fs::path& config);
RunConfiguration parse_run_configuration(std::string_view configContents, const fs::path& basePath); // used for testing

}
