#include <lumen/asset/image.h>
#include <lumen/asset/scene_loader.h>
#include <lumen/core/config.h>
#include <lumen/core/log.h>
#include <lumen/core/time.h>
#include <lumen/renderer/renderer.h>
#include <CLI/CLI.hpp>
#include <filesystem>
#include <iostream>
#include <string>

/**
 * lumen - renders a JSON scene description into a plain-text PPM image
 */
int main(int argc, char** argv) {
    CLI::App app{"lumen - render a JSON scene to a PPM image"};
    app.failure_message(CLI::FailureMessage::help);

    std::filesystem::path scenePath;
    std::filesystem::path outputPath;
    std::filesystem::path configPath = "lumen.json";
    unsigned threads = 1;
    std::string logLevel;

    app.add_option("scene", scenePath, "Path to the scene description (JSON)")
        ->required();

    app.add_option("output", outputPath, "Path of the PPM image to write")
        ->required();

    app.add_option("--config", configPath, "Optional settings file (JSON)");

    auto* threadsOption = app.add_option("--threads", threads, "Render workers, 0 for one per hardware thread");

    auto* logLevelOption = app.add_option("--log-level", logLevel, "trace, debug, info, warn, error, critical or off");

    CLI11_PARSE(app, argc, argv);

    try {
        auto settings = lumen::config::load_from_file(configPath);
        if (threadsOption->count() > 0) {
            settings.threads = threads;
        }
        if (logLevelOption->count() > 0) {
            settings.log_level = lumen::config::parse_log_level(logLevel);
        }
        lumen::log::init(settings.log_level);

        auto scene = lumen::asset::LoadScene(scenePath);

        lumen::renderer::RenderOptions options;
        options.Threads = settings.threads;

        auto pixels = [&] {
            lumen::time::ScopedTimer timer("render");
            return lumen::renderer::Render(scene, options);
        }();

        lumen::asset::WritePpm(outputPath, pixels);

        return 0;

    } catch (const std::exception& e) {
        LUMEN_LOG_ERROR("{}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
