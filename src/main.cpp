#include "core/detection_config.hpp"
#include "core/detection_engine.hpp"
#include "core/detection_errors.hpp"
#include "core/logger_observer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <signal.h>
#include <thread>

namespace
{
    std::atomic<bool> g_interrupted{false};

    void handleInterrupt(int)
    {
        g_interrupted.store(true);
    }

    void printUsage(const char *program)
    {
        std::cout << "AI-generated media detector" << std::endl;
        std::cout << "Usage: " << program << " <file> [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --mime TYPE        Declared MIME type (default: derived from the file extension)" << std::endl;
        std::cout << "  --config PATH      Configuration file (default: config/config.json)" << std::endl;
        std::cout << "  --upload-ref ID    Upload reference stored with the result (default: file name)" << std::endl;
        std::cout << "  --no-persist       Print the verdict without storing it" << std::endl;
        std::cout << "  --help, -h         Show this help message" << std::endl;
    }

    std::string mimeFromExtension(const std::filesystem::path &path)
    {
        static const std::map<std::string, std::string> kMimeTypes = {
            {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"}, {".webp", "image/webp"},
            {".tif", "image/tiff"}, {".tiff", "image/tiff"}, {".bmp", "image/bmp"}, {".gif", "image/gif"},
            {".mp4", "video/mp4"}, {".mov", "video/quicktime"}, {".avi", "video/x-msvideo"},
            {".mkv", "video/x-matroska"}, {".webm", "video/webm"}};

        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        auto it = kMimeTypes.find(ext);
        return it != kMimeTypes.end() ? it->second : "application/octet-stream";
    }

    std::vector<uint8_t> readFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.good())
        {
            throw std::runtime_error("cannot open " + path);
        }
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
}

int main(int argc, char *argv[])
{
    std::string file_path;
    std::string mime_type;
    std::string config_path = "config/config.json";
    std::string upload_reference;
    bool persist = true;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--mime" || arg == "--config" || arg == "--upload-ref") && i + 1 < argc)
        {
            std::string value = argv[++i];
            if (arg == "--mime")
                mime_type = value;
            else if (arg == "--config")
                config_path = value;
            else
                upload_reference = value;
        }
        else if (arg == "--no-persist")
        {
            persist = false;
        }
        else if (!arg.empty() && arg[0] != '-' && file_path.empty())
        {
            file_path = arg;
        }
        else
        {
            std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (file_path.empty())
    {
        printUsage(argv[0]);
        return 1;
    }

    Logger::init("INFO");

    try
    {
        DetectionConfigManager config_manager;
        config_manager.loadFile(config_path);
        LoggerObserver logger_observer;
        config_manager.subscribe(&logger_observer);

        const DetectionConfig config = config_manager.snapshot();
        Logger::setLevel(config.log_level);

        auto engine = DetectionEngine::create(config, persist);

        const std::filesystem::path path(file_path);
        if (mime_type.empty())
            mime_type = mimeFromExtension(path);
        if (upload_reference.empty())
            upload_reference = path.filename().string();

        AnalysisInput input(readFile(file_path), mime_type, path.filename().string());

        // SIGINT cancels the run; the watcher turns the signal flag into a token cancel
        CancellationToken token;
        signal(SIGINT, handleInterrupt);
        std::atomic<bool> finished{false};
        std::thread watcher([&token, &finished]()
                            {
            while (!finished.load())
            {
                if (g_interrupted.load())
                {
                    token.cancel("interrupted by user");
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            } });

        nlohmann::json output;
        int exit_code = 0;
        try
        {
            if (persist)
            {
                PersistedDetection result = engine->analyzeAndPersist(input, upload_reference, token);
                output = verdictToJson(result.verdict);
                output["reference_key"] = result.reference.reference_key;
                output["detail_persisted"] = result.reference.detail_persisted;
                if (!result.reference.detail_error.empty())
                    output["detail_error"] = result.reference.detail_error;
            }
            else
            {
                output = verdictToJson(engine->runDetection(input, token));
            }
        }
        catch (const InsufficientEvidence &e)
        {
            Logger::error(std::string("Insufficient evidence: ") + e.what());
            output = {{"error", "insufficient_evidence"}, {"message", e.what()}};
            exit_code = 2;
        }
        catch (const PersistenceFailure &e)
        {
            Logger::error(std::string("Persistence failure: ") + e.what());
            output = {{"error", "persistence_failure"}, {"message", e.what()}};
            exit_code = 3;
        }
        catch (const DetectionCancelled &e)
        {
            Logger::warn(e.what());
            output = {{"error", "cancelled"}, {"message", e.what()}};
            exit_code = 1;
        }
        catch (const std::exception &e)
        {
            Logger::error(std::string("Detection failed: ") + e.what());
            output = {{"error", "detection_failed"}, {"message", e.what()}};
            exit_code = 1;
        }

        finished.store(true);
        watcher.join();

        std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return exit_code;
    }
    catch (const ConfigurationError &e)
    {
        Logger::error(std::string("Configuration error: ") + e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Detection failed: ") + e.what());
        return 1;
    }
}
