#include "app_constants.hpp"
#include "config/config_loader.hpp"
#include "common/non_fatal.hpp"
#include "config/config_types.hpp"
#include "events/event_bus.hpp"
#include "fuse_operations.hpp"
#include "registry/metadata_store.hpp"
#include "registry/storage_registry.hpp"

#include <fuse3/fuse.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

void ShutdownRegistry(TierFS::Registry::StorageRegistry &registry)
{
    auto shutdown_res = registry.Shutdown();
    if (!shutdown_res) {
        spdlog::error("Error shutting down storage registry: {}", shutdown_res.error().message());
    }
}

}  // namespace

int main(int argc, char *argv[])
{
    // Command Line argument parsing
    CLI::App app{std::string(TierFS::Constants::APP_NAME)};
    app.allow_extras();

    std::string config_path_str;
    std::string source_id;
    std::string mount_point_str;

    app.add_option("-c,--config", config_path_str, "Path to the configuration JSON file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option(
        "-s,--source", source_id, "Source id to expose (defaults to the first configured source)"
    );
    app.add_option("mountpoint", mount_point_str, "Path to the FUSE mount point")->required();

    app.set_version_flag("-v,--version", std::string(TierFS::Constants::APP_VERSION_STRING));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    // Initialize default logger (console) before config is parsed
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(std::string(TierFS::Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger = std::make_shared<spdlog::logger>(
            std::string(TierFS::Constants::APP_NAME), console_sink
        );
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(TierFS::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(TierFS::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    spdlog::info("{} starting...", TierFS::Constants::APP_NAME);

    // Load Configuration
    std::filesystem::path config_path(config_path_str);
    auto config_result = TierFS::Config::LoadConfigFromFileVerbose(config_path);
    if (!config_result) {
        spdlog::critical("Error loading configuration: {}", config_result.error());
        return EXIT_FAILURE;
    }

    // Initialize Logging Level from Config
    spdlog::set_level(config_result->global_settings.log_level);
    spdlog::info(
        "Logging level set to: {}",
        spdlog::level::to_string_view(config_result->global_settings.log_level)
    );

    if (config_result->sources.empty()) {
        spdlog::critical("Configuration defines no sources to mount");
        return EXIT_FAILURE;
    }
    if (source_id.empty()) {
        source_id = config_result->sources.front().id;
    }

    // Setup Core Components
    auto settings = TierFS::Registry::RegistrySettings::FromConfig(*config_result);
    auto ledger   = std::make_shared<TierFS::Common::NonFatalLedger>();
    auto events   = std::make_shared<TierFS::Events::InProcessEventBus>(ledger);
    auto metadata = std::make_shared<TierFS::Registry::JsonMetadataStore>(
        settings.state_dir / TierFS::Constants::METADATA_FILE_NAME
    );

    std::unique_ptr<TierFS::Registry::StorageRegistry> registry;
    try {
        registry = std::make_unique<TierFS::Registry::StorageRegistry>(settings, events, metadata);
    } catch (const std::exception &e) {
        spdlog::critical("Error initializing components: {}", e.what());
        return EXIT_FAILURE;
    }

    auto init_res = registry->Initialize();
    if (!init_res) {
        spdlog::critical("Error initializing storage registry: {}", init_res.error().message());
        ShutdownRegistry(*registry);
        return EXIT_FAILURE;
    }
    if (auto load_res = metadata->Load(); !load_res) {
        spdlog::warn("User metadata unavailable: {}", load_res.error().message());
    }

    const size_t mounted = registry->AddSources(config_result->sources);
    spdlog::info("Mounted {} of {} sources", mounted, config_result->sources.size());

    auto source = registry->GetSource(source_id);
    if (!source) {
        spdlog::critical("Source '{}' is not available: {}", source_id, source.error().message());
        ShutdownRegistry(*registry);
        return EXIT_FAILURE;
    }
    spdlog::info("Mounting source '{}' ({}) at {}", source->name, source->id, mount_point_str);

    // Setup Filesystem Context
    auto context_ptr       = std::make_unique<TierFS::FileSystemContext>();
    context_ptr->config    = std::move(config_result.value());
    context_ptr->source_id = source_id;
    context_ptr->registry  = std::move(registry);

    // Construct arguments for fuse_main
    std::vector<char *> fuse_argv;
    fuse_argv.push_back(argv[0]);  // Program name

    std::vector<std::string> remaining_args_storage = app.remaining();
    for (const auto &arg : remaining_args_storage) {
        fuse_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    fuse_argv.push_back(const_cast<char *>(mount_point_str.c_str()));

    spdlog::debug("Arguments passed to fuse_main:");
    for (const char *arg : fuse_argv) {
        spdlog::debug("  '{}'", arg);
    }

    // Ensure ops struct lives longer than fuse_main
    static fuse_operations fs_ops = TierFS::FuseOps::get_fuse_operations();

    spdlog::info("Starting FUSE main loop...");
    int fuse_ret =
        fuse_main(static_cast<int>(fuse_argv.size()), fuse_argv.data(), &fs_ops, context_ptr.get());
    spdlog::trace("FUSE main loop finished with code: {}", fuse_ret);

    spdlog::info("Shutting down components and cleaning up resources...");
    ShutdownRegistry(*context_ptr->registry);
    for (const auto &failure : ledger->Recent()) {
        spdlog::debug("Non-fatal failure during run: {} ({})", failure.label, failure.message);
    }

    spdlog::info("{} exiting...", TierFS::Constants::APP_NAME);
    spdlog::shutdown();

    return fuse_ret == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
