#pragma once

#include "shipem/runconfiguration.h"
#include "infra/filesystem.h"
#include "infra/log.h"
#include "infra/progressinfo.h"

#include <cstdint>
#include <optional>
#include <string>

namespace shipem {

struct ModelProgressInfo
{
    ModelProgressInfo() = default;
    ModelProgressInfo(std::string_view i)
    : info(i)
    {
    }

    std::string to_string() const
    {
        return info;
    }

    std::string info;
};

using ModelProgress = inf::ProgressTracker<ModelProgressInfo>;

int run_model(const fs::path& runConfigPath, inf::Log::Level logLevel, std::optional<int32_t> concurrency, const ModelProgress::Callback& progressCb);
int run_model(const RunConfiguration& cfg, const ModelProgress::Callback& progressCb);

/* Validates the configuration without calculating emissions: prints the vessel info that
 * would be used for every vessel and reports vessels that cannot be processed */
int check_configuration(const fs::path& runConfigPath);
int check_configuration(const RunConfiguration& cfg);

}
