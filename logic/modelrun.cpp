#include "shipem/modelrun.h"

#include "shipem/configurationparser.h"
#include "shipem/runconfigurationparser.h"
#include "outputwriters.h"
#include "runsummary.h"
#include "vesselemissions.h"

#include "infra/chrono.h"
#include "infra/exception.h"
#include "infra/string.h"

#include <mutex>
#include <numeric>
#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/info.h>
#include <oneapi/tbb/parallel_for_each.h>

namespace shipem {

using namespace inf;

int run_model(const fs::path& runConfigPath, inf::Log::Level logLevel, std::optional<int32_t> concurrency, const ModelProgress::Callback& progressCb)
{
    auto runConfig = parse_run_configuration_file(runConfigPath);
    runConfig.set_max_concurrency(concurrency);
    std::unique_ptr<inf::LogRegistration> logReg;
    inf::Log::add_file_sink(runConfig.log_output_path());

    logReg = std::make_unique<inf::LogRegistration>("shipem");
    inf::Log::set_level(logLevel);

    return run_model(runConfig, progressCb);
}

static void clean_output_directory(const fs::path& p)
{
    if (!fs::exists(p)) {
        return;
    }

    Log::debug("Clean output directory");
    try {
        for (auto& entry : fs::directory_iterator(p)) {
            if (entry.is_regular_file()) {
                // Don't remove the log file we have in use
                if (entry.path().extension() != ".log") {
                    fs::remove(entry);
                }
            } else if (entry.is_directory()) {
                fs::remove_all(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        Log::error(e.what());
        throw RuntimeError("Failed to clean up existing output directory, make sure none of the files are opened");
    }

    Log::debug("Output directory cleaned up");
}

int run_model(const RunConfiguration& cfg, const ModelProgress::Callback& progressCb)
{
    try {
        tbb::global_control tbbControl(tbb::global_control::max_allowed_parallelism, cfg.max_concurrency().value_or(oneapi::tbb::info::default_concurrency()));

        clean_output_directory(cfg.output_path());

        const auto emissionConfig = parse_emission_configuration_file(cfg.emission_configuration_path());

        RunSummary summary;

        const auto vessels = cfg.vessels();
        std::vector<std::vector<EmissionOutputEntry>> vesselResults(vessels.size());

        {
            chrono::ScopedDurationLog d("Calculate vessel emissions");

            std::vector<size_t> indexes(vessels.size());
            std::iota(indexes.begin(), indexes.end(), size_t(0));

            ModelProgress progress(vessels.size(), progressCb);
            std::mutex mut;

            tbb::parallel_for_each(indexes, [&](size_t index) {
                const auto& vessel   = vessels[index];
                vesselResults[index] = calculate_vessel_emissions(vessel, emissionConfig, cfg, summary);

                std::scoped_lock lock(mut);
                progress.set_payload(ModelProgressInfo(fmt::format("Processed vessel '{}'", vessel.name)));
                progress.tick();
            });
        }

        std::vector<EmissionOutputEntry> entries;
        for (auto& results : vesselResults) {
            std::move(results.begin(), results.end(), std::back_inserter(entries));
        }

        {
            chrono::ScopedDurationLog d("Write model output");
            write_emissions_csv(entries, cfg.emissions_output_path());
            summary.write_summary(cfg.run_summary_output_path());
        }

        if (auto failures = summary.failure_count(); failures > 0) {
            Log::warn("Emissions could not be calculated for {} of {} vessels, see the run summary", failures, vessels.size());
        }

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        Log::error(e.what());
        fmt::print("{}\n", e.what());
        return EXIT_FAILURE;
    }
}

int check_configuration(const fs::path& runConfigPath)
{
    try {
        return check_configuration(parse_run_configuration_file(runConfigPath));
    } catch (const std::exception& e) {
        fmt::print("{}\n", e.what());
        return EXIT_FAILURE;
    }
}

int check_configuration(const RunConfiguration& cfg)
{
    try {
        const auto emissionConfig = parse_emission_configuration_file(cfg.emission_configuration_path());
        fmt::print("Emission configuration: {} (pollutants: {})\n", cfg.emission_configuration_path(), str::join(emissionConfig.pollutant_names(), ", "));

        size_t invalidVessels = 0;
        for (const auto& vessel : cfg.vessels()) {
            std::vector<std::string> problems;

            try {
                const auto info = emissionConfig.guess_vessel_info(vessel.attributes);
                fmt::print("{}: {}\n", vessel.name, info);
            } catch (const std::exception& e) {
                problems.emplace_back(e.what());
            }

            for (const auto& track : vessel.tracks) {
                if (!fs::is_regular_file(track.path)) {
                    problems.push_back(fmt::format("track file does not exist: {}", track.path));
                }
            }

            for (const auto& problem : problems) {
                fmt::print("{}: {}\n", vessel.name, problem);
            }

            if (!problems.empty()) {
                ++invalidVessels;
            }
        }

        if (invalidVessels > 0) {
            fmt::print("{} of {} vessels can not be processed\n", invalidVessels, cfg.vessels().size());
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        fmt::print("{}\n", e.what());
        return EXIT_FAILURE;
    }
}

}
