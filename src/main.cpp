/**
 * @file main.cpp
 * @brief passcheck-validate: validate a single photo from the command line
 *
 * Exit codes: 0 approved, 1 rejected, 2 usage or runtime error.
 */

#include "passcheck/passcheck.h"

#include <opencv2/imgcodecs.hpp>

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace passcheck;

namespace {

constexpr int kExitApproved = 0;
constexpr int kExitRejected = 1;
constexpr int kExitError = 2;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <image> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help             Show this help message" << std::endl;
    std::cout << "  -c, --config FILE      Load check parameters from a YAML file" << std::endl;
    std::cout << "      --cascade FILE     Haar cascade for face detection (default: system cascade)" << std::endl;
    std::cout << "  -m, --landmarks FILE   FacemarkLBF model (default: lbfmodel.yaml)" << std::endl;
    std::cout << "  -j, --json             Print the result document as JSON" << std::endl;
    std::cout << "  -l, --log-dir DIR      Write a timestamped log file to DIR" << std::endl;
    std::cout << "  -v, --verbose          Enable verbose logging" << std::endl;
}

void printResult(const model::CheckResult& result) {
    std::cout << "  [" << (result.isPassed() ? "PASS" : "FAIL") << "] "
              << std::left << std::setw(15) << result.getCheckName() << std::right
              << std::fixed << std::setprecision(2) << result.getConfidence()
              << "  " << result.getMessage() << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string imagePath;
    std::string configFile;
    std::string cascadeFile;
    std::string landmarkModel = "lbfmodel.yaml";
    std::string logDirectory;
    bool jsonOutput = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return kExitApproved;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--cascade" && i + 1 < argc) {
            cascadeFile = argv[++i];
        } else if ((arg == "-m" || arg == "--landmarks") && i + 1 < argc) {
            landmarkModel = argv[++i];
        } else if ((arg == "-l" || arg == "--log-dir") && i + 1 < argc) {
            logDirectory = argv[++i];
        } else if (arg == "-j" || arg == "--json") {
            jsonOutput = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] != '-' && imagePath.empty()) {
            imagePath = arg;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return kExitError;
        }
    }

    if (imagePath.empty()) {
        printUsage(argv[0]);
        return kExitError;
    }

    auto& logger = core::Logger::getInstance();
    if (initialize(verbose ? core::LogLevel::DEBUG : core::LogLevel::INFO, logDirectory) != core::ResultCode::SUCCESS) {
        std::cerr << "Warning: file logging could not be initialized, using console only" << std::endl;
    }
    if (jsonOutput) {
        // Keep stdout clean for the JSON document
        logger.setConsoleOutput(false);
    }

    try {
        checks::CheckConfig checkConfig;
        if (!configFile.empty()) {
            checkConfig = checks::loadCheckConfig(configFile);
        }
        LOG_DEBUG("Check configuration: " + checkConfig.toString());

        cv::Mat image = cv::imread(imagePath, cv::IMREAD_COLOR);
        if (image.empty()) {
            std::cerr << "Cannot read image: " << imagePath << std::endl;
            return kExitError;
        }
        LOG_INFO("Validating " + imagePath + " (" + std::to_string(image.cols) + "x" +
                 std::to_string(image.rows) + ")");

        face::LandmarkExtractionConfig extractorConfig;
        extractorConfig.cascade_path = cascadeFile;
        extractorConfig.model_path = landmarkModel;
        auto extractor = std::make_shared<face::LandmarkExtractor>(extractorConfig);

        validation::ValidationPipeline pipeline(extractor, checkConfig);
        if (!jsonOutput) {
            pipeline.addObserver(std::make_shared<validation::CallbackObserver>(
                [](const std::string& message) { std::cout << message << std::endl; }));
        }

        model::PhotoRecord photo(image);
        photo.setFilePath(imagePath);
        pipeline.run(photo);
        extractor->release();

        const auto summary = validation::ValidationSummary::fromRecord(photo);
        if (jsonOutput) {
            nlohmann::json doc = validation::photoRecordToJson(photo);
            doc["summary"] = summary.toJson();
            std::cout << doc.dump(2) << std::endl;
        } else {
            std::cout << std::endl << "Results for " << imagePath << ":" << std::endl;
            for (const auto& result : photo.getResults()) {
                printResult(result);
            }
            std::cout << std::endl << summary.toString() << std::endl;
        }

        shutdown();
        return photo.getStatus() == model::PhotoStatus::APPROVED ? kExitApproved : kExitRejected;

    } catch (const core::Exception& e) {
        std::cerr << "Error: " << e.getMessage() << " (" << core::resultCodeToString(e.getResultCode()) << ")"
                  << std::endl;
        LOG_ERROR(std::string("Validation failed: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        LOG_ERROR(std::string("Validation failed: ") + e.what());
    }

    shutdown();
    return kExitError;
}
