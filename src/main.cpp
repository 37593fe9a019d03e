#include "rockseg/rockseg.h"

#include <open3d/geometry/PointCloud.h>
#include <open3d/geometry/TriangleMesh.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <input.las> <output_dir> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file.yaml>   Pipeline parameters" << std::endl;
    std::cout << "  --log-dir <dir>        Write a timestamped log file to <dir>" << std::endl;
    std::cout << "  --no-downsample        Skip voxel downsampling" << std::endl;
    std::cout << "  --log-level <level>    trace, debug, info, warning, error, critical" << std::endl;
    std::cout << "  --verbose              Same as --log-level debug" << std::endl;
    std::cout << "  --rock-seeds <i,j,..>  Rock seed indices into the input file" << std::endl;
    std::cout << "  --pedestal-seeds <i,..> Pedestal seed indices into the input file" << std::endl;
    std::cout << "  --help                 Show this message" << std::endl;
    std::cout << std::endl;
    std::cout << "The input intensity channel carries the segmentation: 0 pedestal, 1 rock." << std::endl;
    std::cout << "Without seeds, the apex and the lowest point are used." << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    using namespace rockseg;

    std::string inputFile;
    std::string outputDir;
    std::string configFile;
    std::string logDir;
    std::string levelArg;
    std::string rockSeedArg;
    std::string pedestalSeedArg;
    bool noDownsample = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            logDir = argv[++i];
        } else if (arg == "--no-downsample") {
            noDownsample = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            levelArg = argv[++i];
        } else if (arg == "--verbose") {
            levelArg = "debug";
        } else if (arg == "--rock-seeds" && i + 1 < argc) {
            rockSeedArg = argv[++i];
        } else if (arg == "--pedestal-seeds" && i + 1 < argc) {
            pedestalSeedArg = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        } else if (inputFile.empty()) {
            inputFile = arg;
        } else if (outputDir.empty()) {
            outputDir = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (inputFile.empty() || outputDir.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    if (rockSeedArg.empty() != pedestalSeedArg.empty()) {
        std::cerr << "--rock-seeds and --pedestal-seeds must be given together" << std::endl;
        return 1;
    }

    auto& config = core::Configuration::getInstance();
    if (!configFile.empty() && !config.load(configFile)) {
        std::cerr << "Failed to load configuration: " << configFile << std::endl;
        return 1;
    }

    // Command line wins over logging.level from the configuration
    if (levelArg.empty()) {
        levelArg = config.getString("logging.level", "info");
    }
    core::LogLevel logLevel = core::LogLevel::INFO;
    if (!core::parseLogLevel(levelArg, logLevel)) {
        std::cerr << "Unknown log level: " << levelArg << std::endl;
        return 1;
    }
    if (logDir.empty()) {
        logDir = config.getString("logging.directory", "");
    }

    auto& logger = core::Logger::getInstance();
    logger.setLevel(logLevel);
    if (!logDir.empty()) {
        if (logger.initializeWithTimestamp(logDir, logLevel)) {
            logger.info("Log file: " + logger.getCurrentLogFile());
        } else {
            std::cerr << "Warning: file logging initialization failed, using console only" << std::endl;
        }
    }

    try {
        api::PipelineParameters params = api::PipelineParameters::fromConfiguration(config);
        if (noDownsample) {
            params.downsample = false;
        }
        LOG_DEBUG(params.toString());

        std::filesystem::create_directories(outputDir);

        io::LoadedCloud loaded = io::LasIO::read(inputFile, true);
        auto segmenter = segmentation::PrelabeledSegmenter::fromIntensity(*loaded.cloud, loaded.intensity);
        mesh::PoissonReconstructor reconstructor;

        api::RockPipeline pipeline(params);
        pipeline.load(loaded.cloud, loaded.recentering);

        if (!rockSeedArg.empty()) {
            std::vector<size_t> rock = pointcloud::SeedHeuristic::parseIndexList(rockSeedArg);
            std::vector<size_t> pedestal = pointcloud::SeedHeuristic::parseIndexList(pedestalSeedArg);

            // Seeds index the input file; follow them onto the downsampled cloud
            if (params.downsample) {
                const core::CloudHandle& reduced = pipeline.downsample(params.voxelSize);
                rock = pointcloud::SeedHeuristic::transfer(*loaded.cloud, rock, *reduced.cloud);
                pedestal = pointcloud::SeedHeuristic::transfer(*loaded.cloud, pedestal, *reduced.cloud);
            }
            pipeline.setSeeds(rock, pedestal);
        }

        auto result = pipeline.runAll(*segmenter, reconstructor);

        const std::string lasOut = (std::filesystem::path(outputDir) / "segmented.las").string();
        const std::string meshOut = (std::filesystem::path(outputDir) / "mesh.ply").string();
        io::LasIO::write(lasOut, pipeline.exportRecords());
        io::MeshIO::write(meshOut, *result->mesh);

        LOG_INFO(pipeline.boundaryFill()->toString());
        LOG_INFO(result->toString());
        LOG_INFO("Done: " + lasOut + ", " + meshOut);
    } catch (const core::Exception& e) {
        LOG_ERROR(std::string("[") + core::resultCodeToString(e.getResultCode()) + "] " + e.getMessage() +
                  (e.getContext().empty() ? "" : " (" + e.getContext() + ")"));
        logger.flush();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unexpected error: ") + e.what());
        logger.flush();
        return 1;
    }

    logger.flush();
    return 0;
}
