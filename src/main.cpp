#include <curl/curl.h>
#include <exception>
#include <string>
#include <vector>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/run/ingestion_run.hpp"
#include "target/target_loader.hpp"

namespace {

using Umbra::Core::Config;
using Umbra::Core::Constants;
using Umbra::Core::Logger;

std::vector<std::string> collect_targets(const Config& config) {
    std::vector<std::string> targets;
    for (const auto& path : config.target_files) {
        auto loaded = Umbra::Target::TargetLoader::load_file(path);
        Logger::info("Loaded " + std::to_string(loaded.size()) + " targets from " + path);
        targets.insert(targets.end(), loaded.begin(), loaded.end());
    }
    targets.insert(targets.end(), config.urls.begin(), config.urls.end());
    return targets;
}

int run_ingestion(const Config& config, const std::vector<std::string>& targets) {
    curl_global_init(CURL_GLOBAL_ALL);

    int exit_code = 0;
    {
        Umbra::Engine::IngestionRun run(config);
        auto report = run.execute(targets);

        if (!config.summary_path.empty()) {
            try {
                report.summary.write(config.summary_path);
                Logger::info("Run summary written to " + config.summary_path);
            } catch (const std::exception& e) {
                Logger::error(e.what());
            }
        }

        if (report.fatal) {
            Logger::error("Run aborted: " + report.fatal_error);
            exit_code = 2;
        }
    }

    curl_global_cleanup();
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = Config::parse(argc, argv);

    try {
        config.validate();
        Logger::set_level(Logger::parse_level(config.log_level));
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    std::vector<std::string> targets;
    try {
        targets = collect_targets(config);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    if (targets.empty()) {
        Logger::error("No targets provided. Pass addresses or --file <list>.");
        return 1;
    }

    Logger::info(std::string("umbra ") + Constants::VERSION + ": " + std::to_string(targets.size())
                 + " targets");
    try {
        return run_ingestion(config, targets);
    } catch (const std::exception& e) {
        Logger::error("Startup failed: " + std::string(e.what()));
        return 1;
    }
}
