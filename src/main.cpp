#include "core/file_utils.hpp"
#include "core/gallery_data_provider.hpp"
#include "core/logger_observer.hpp"
#include "core/media_classifier.hpp"
#include "core/poco_config_manager.hpp"
#include "core/scan_coordinator.hpp"
#include "core/scan_events.hpp"
#include "core/shutdown_manager.hpp"
#include "core/thumbnail_cache.hpp"
#include "database/metadata_store.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <opencv2/imgcodecs.hpp>

namespace
{
    constexpr int EXIT_CANCELLED = 130;

    struct CommandLine
    {
        std::string config_path = "config.json";
        bool config_given = false;
        std::string db_path;
        std::string log_level;
        std::string command;
        std::vector<std::string> args;
    };

    void printUsage(const char *program)
    {
        std::cout << "Gallery Indexer - media file indexer" << std::endl;
        std::cout << "Usage: " << program << " [options] COMMAND [ARGS]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE        Configuration file (default: config.json)" << std::endl;
        std::cout << "  --db FILE            Database file (overrides database.path)" << std::endl;
        std::cout << "  --log-level LEVEL    TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h           Show this help message" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  scan DIR                           Index DIR recursively" << std::endl;
        std::cout << "  list [FOLDER]                      List indexed files" << std::endl;
        std::cout << "  folders                            List folders containing indexed files" << std::endl;
        std::cout << "  remove-folder FOLDER               Forget every file under FOLDER" << std::endl;
        std::cout << "  stats                              Show index statistics" << std::endl;
        std::cout << "  compact                            Reclaim unused database space" << std::endl;
        std::cout << "  formats list                       Show enabled extensions" << std::endl;
        std::cout << "  formats add|remove image|video EXT Enable or disable an extension" << std::endl;
        std::cout << "  thumbs OUT_DIR [FOLDER]            Write thumbnails as PNG files" << std::endl;
    }

    // Returns false on a malformed command line
    bool parseCommandLine(int argc, char *argv[], CommandLine &cmd)
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (!cmd.command.empty())
            {
                cmd.args.push_back(arg);
            }
            else if (arg == "--config" || arg == "--db" || arg == "--log-level")
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Error: " << arg << " requires a value" << std::endl;
                    return false;
                }
                std::string value = argv[++i];
                if (arg == "--config")
                {
                    cmd.config_path = value;
                    cmd.config_given = true;
                }
                else if (arg == "--db")
                {
                    cmd.db_path = value;
                }
                else
                {
                    cmd.log_level = value;
                }
            }
            else if (arg.rfind("--", 0) == 0)
            {
                std::cerr << "Error: unknown option " << arg << std::endl;
                return false;
            }
            else
            {
                cmd.command = arg;
            }
        }
        return !cmd.command.empty();
    }

    std::string formatBytes(uint64_t bytes)
    {
        const char *units[] = {"B", "KB", "MB", "GB", "TB"};
        double value = static_cast<double>(bytes);
        int unit = 0;
        while (value >= 1024.0 && unit < 4)
        {
            value /= 1024.0;
            ++unit;
        }
        std::ostringstream out;
        out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
        return out.str();
    }

    void saveConfig(const CommandLine &cmd)
    {
        if (!PocoConfigManager::getInstance().save(cmd.config_path))
        {
            Logger::warn("Could not save configuration to " + cmd.config_path);
        }
    }

    int runScan(const CommandLine &cmd, MetadataStore &store)
    {
        if (cmd.args.size() != 1)
        {
            std::cerr << "Usage: scan DIR" << std::endl;
            return 1;
        }
        auto &config = PocoConfigManager::getInstance();

        ScanOptions options;
        options.progress_interval_ms = config.getProgressIntervalMs();
        ScanCoordinator coordinator(store, [&config]
                                    { return MediaClassifier::fromConfig(config); }, options);

        ScanEventQueue events;
        coordinator.subscribe(&events);

        auto &shutdown = ShutdownManager::getInstance();
        shutdown.installSignalHandlers();
        int cancel_id = shutdown.addCallback([&coordinator]
                                             { coordinator.cancel(); });

        std::string root = FileUtils::normalizeFolder(cmd.args[0]);
        ScanStartResult started = coordinator.startScan(root);
        if (started != ScanStartResult::STARTED)
        {
            shutdown.removeCallback(cancel_id);
            coordinator.unsubscribe(&events);
            std::cerr << "Error: cannot scan " << root << ": " << scanStartResultToString(started) << std::endl;
            config.setLastScanInfo(coordinator.lastSummary().toLastScanInfo());
            saveConfig(cmd);
            return 1;
        }

        bool finished = false;
        while (!finished)
        {
            for (const auto &event : events.waitAndDrain(std::chrono::milliseconds(250)))
            {
                if (event.isTerminal())
                {
                    finished = true;
                    std::cout << event.message << std::endl;
                }
                else
                {
                    std::cout << "[" << event.files_processed << " scanned, " << event.files_inserted
                              << " new] " << event.path << std::endl;
                }
            }
        }

        coordinator.wait();
        shutdown.removeCallback(cancel_id);
        coordinator.unsubscribe(&events);

        ScanSummary summary = coordinator.lastSummary();
        for (const auto &failure : summary.walk_failures)
        {
            std::cerr << "Skipped " << failure.path << ": " << failure.reason << std::endl;
        }
        config.setLastScanInfo(summary.toLastScanInfo());
        saveConfig(cmd);

        switch (summary.status)
        {
        case ScanStatus::COMPLETED:
            return 0;
        case ScanStatus::CANCELLED:
            return EXIT_CANCELLED;
        default:
            std::cerr << "Scan failed: " << summary.error_message << std::endl;
            return 1;
        }
    }

    int runList(const CommandLine &cmd, MetadataStore &store)
    {
        ThumbnailCache thumbnails;
        GalleryDataProvider gallery(store, thumbnails);
        if (!cmd.args.empty())
        {
            gallery.setFolderFilter(cmd.args[0]);
        }
        gallery.refresh();

        auto rows = gallery.snapshot();
        for (const auto &record : *rows)
        {
            std::cout << std::left << std::setw(8) << MediaTypes::getTypeName(record.type) << std::setw(32)
                      << record.filename << record.path << std::endl;
        }
        std::cout << rows->size() << " files" << std::endl;
        return 0;
    }

    int runFolders(MetadataStore &store)
    {
        for (const auto &folder : store.folders())
        {
            std::cout << folder << std::endl;
        }
        return 0;
    }

    int runRemoveFolder(const CommandLine &cmd, MetadataStore &store)
    {
        if (cmd.args.size() != 1)
        {
            std::cerr << "Usage: remove-folder FOLDER" << std::endl;
            return 1;
        }
        DBOpResult result = store.removeInFolder(cmd.args[0]);
        if (!result.success)
        {
            std::cerr << "Error: " << result.error_message << std::endl;
            return 1;
        }
        std::cout << "Removed " << result.rows_affected << " files" << std::endl;
        return 0;
    }

    int runStats(MetadataStore &store)
    {
        auto counts = store.countByType();
        std::cout << "Total files:   " << store.count() << std::endl;
        std::cout << "Images:        " << counts[MediaType::IMAGE] << std::endl;
        std::cout << "Videos:        " << counts[MediaType::VIDEO] << std::endl;
        std::cout << "Other:         " << counts[MediaType::UNKNOWN] << std::endl;
        std::cout << "Database size: " << formatBytes(store.databaseSizeBytes()) << std::endl;

        nlohmann::json last_scan = PocoConfigManager::getInstance().getLastScanInfo();
        std::cout << "Last scan:     " << last_scan.value("timestamp", "Never") << " ("
                  << last_scan.value("status", "N/A") << ")" << std::endl;
        if (last_scan.contains("root"))
        {
            std::cout << "  root:        " << last_scan.value("root", "") << std::endl;
            std::cout << "  new files:   " << last_scan.value("new_files_count", 0) << " of "
                      << last_scan.value("total_files_scanned", 0) << " scanned" << std::endl;
        }
        return 0;
    }

    int runCompact(MetadataStore &store)
    {
        uint64_t before = store.databaseSizeBytes();
        DBOpResult result = store.optimize();
        if (!result.success)
        {
            std::cerr << "Error: " << result.error_message << std::endl;
            return 1;
        }
        std::cout << "Database compacted: " << formatBytes(before) << " -> " << formatBytes(store.databaseSizeBytes())
                  << std::endl;
        return 0;
    }

    int runFormats(const CommandLine &cmd)
    {
        auto &config = PocoConfigManager::getInstance();
        if (cmd.args.empty() || cmd.args[0] == "list")
        {
            auto print = [](const std::string &label, const std::vector<std::string> &extensions)
            {
                std::cout << label;
                for (const auto &ext : extensions)
                {
                    std::cout << " " << ext;
                }
                std::cout << std::endl;
            };
            print("image:", config.getEnabledImageExtensions());
            print("video:", config.getEnabledVideoExtensions());
            return 0;
        }

        if (cmd.args.size() != 3 || (cmd.args[0] != "add" && cmd.args[0] != "remove"))
        {
            std::cerr << "Usage: formats list | formats add|remove image|video EXT" << std::endl;
            return 1;
        }

        try
        {
            bool changed = cmd.args[0] == "add" ? config.addExtension(cmd.args[1], cmd.args[2])
                                                : config.removeExtension(cmd.args[1], cmd.args[2]);
            if (!changed)
            {
                std::cout << "No change: " << cmd.args[2] << " is already "
                          << (cmd.args[0] == "add" ? "enabled" : "disabled") << " for " << cmd.args[1] << std::endl;
                return 0;
            }
        }
        catch (const std::invalid_argument &e)
        {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }

        saveConfig(cmd);
        std::cout << "Updated " << cmd.args[1] << " formats" << std::endl;
        return 0;
    }

    int runThumbs(const CommandLine &cmd, MetadataStore &store)
    {
        if (cmd.args.empty() || cmd.args.size() > 2)
        {
            std::cerr << "Usage: thumbs OUT_DIR [FOLDER]" << std::endl;
            return 1;
        }
        auto &config = PocoConfigManager::getInstance();

        std::error_code ec;
        std::filesystem::create_directories(cmd.args[0], ec);
        if (ec)
        {
            std::cerr << "Error: cannot create " << cmd.args[0] << ": " << ec.message() << std::endl;
            return 1;
        }

        ThumbnailCache thumbnails(config.getThumbnailMaxDimension(), config.getMaxDecoderThreads());
        GalleryDataProvider gallery(store, thumbnails);
        if (cmd.args.size() == 2)
        {
            gallery.setFolderFilter(cmd.args[1]);
        }
        gallery.refresh();

        const size_t rows = gallery.rowCount();
        for (size_t i = 0; i < rows; ++i)
        {
            gallery.thumbnailFor(i);
        }
        thumbnails.waitIdle();

        size_t written = 0;
        for (size_t i = 0; i < rows; ++i)
        {
            MediaRecord record = gallery.rowAt(i);
            Thumbnail thumb = gallery.thumbnailFor(i);

            std::ostringstream name;
            name << std::setw(5) << std::setfill('0') << i << "_"
                 << std::filesystem::path(record.filename).stem().string() << ".png";
            std::string out_path = (std::filesystem::path(cmd.args[0]) / name.str()).string();

            try
            {
                if (cv::imwrite(out_path, *thumb.image))
                {
                    ++written;
                }
                else
                {
                    Logger::warn("Could not write " + out_path);
                }
            }
            catch (const cv::Exception &e)
            {
                Logger::warn("Could not write " + out_path + ": " + e.what());
            }
            Logger::debug(record.path + " -> " + out_path + " (" + thumbnailStateToString(thumb.state) + ")");
        }

        std::cout << "Wrote " << written << " of " << rows << " thumbnails to " << cmd.args[0] << " ("
                  << thumbnails.decodeCount() << " decoded)" << std::endl;
        return written == rows ? 0 : 1;
    }
}

int main(int argc, char *argv[])
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
    }

    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd))
    {
        printUsage(argv[0]);
        return 1;
    }

    Logger::init("INFO");

    auto &config = PocoConfigManager::getInstance();
    if (!config.load(cmd.config_path))
    {
        if (cmd.config_given)
        {
            Logger::warn("Could not load " + cmd.config_path + ", using defaults");
        }
        config.initializeDefaultConfig();
    }
    Logger::init(config.getLogLevel());

    LoggerObserver logger_observer;
    config.subscribe(&logger_observer);

    int exit_code = 1;
    try
    {
        if (!cmd.log_level.empty())
        {
            config.update({{"log_level", cmd.log_level}});
        }
        if (!cmd.db_path.empty())
        {
            config.update({{"database", {{"path", cmd.db_path}}}});
        }
        if (!config.validateConfig())
        {
            Logger::warn("Configuration has invalid values; defaults are used where needed");
        }

        if (cmd.command == "formats")
        {
            exit_code = runFormats(cmd);
        }
        else
        {
            MetadataStore store(config.getDatabasePath(), config.getDatabaseBusyTimeoutMs());
            if (!store.isOpen())
            {
                std::cerr << "Error: cannot open database " << config.getDatabasePath() << std::endl;
                config.unsubscribe(&logger_observer);
                return 1;
            }

            if (cmd.command == "scan")
                exit_code = runScan(cmd, store);
            else if (cmd.command == "list")
                exit_code = runList(cmd, store);
            else if (cmd.command == "folders")
                exit_code = runFolders(store);
            else if (cmd.command == "remove-folder")
                exit_code = runRemoveFolder(cmd, store);
            else if (cmd.command == "stats")
                exit_code = runStats(store);
            else if (cmd.command == "compact")
                exit_code = runCompact(store);
            else if (cmd.command == "thumbs")
                exit_code = runThumbs(cmd, store);
            else
            {
                std::cerr << "Unknown command: " << cmd.command << std::endl;
                printUsage(argv[0]);
            }
        }
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Fatal error: ") + e.what());
        exit_code = 1;
    }

    config.unsubscribe(&logger_observer);
    return exit_code;
}
