#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ball_detection.hpp"
#include "ballscan.hpp"
#include "image_loader.hpp"
#include "image_processing.hpp"
#include "json_parser.hpp"

namespace fs = std::filesystem;
using namespace cv;
using namespace std;

static void printUsage(const char* program) {
    cerr << "Usage: " << program
         << " <image-or-directory> [pool|snooker] [--config <file.json>] [--annotate <outdir>]"
         << endl;
}

static bool isImageFile(const fs::path& path) {
    string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

static string readTextFile(const string& path) {
    ifstream file(path);
    if (!file) {
        throw runtime_error("Could not open config at " + path);
    }
    stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    string input = argv[1];
    GameMode mode = GameMode::POOL;
    string configPath;
    string annotateDir;

    try {
        for (int i = 2; i < argc; ++i) {
            string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--annotate" && i + 1 < argc) {
                annotateDir = argv[++i];
            } else if (arg.rfind("--", 0) == 0) {
                printUsage(argv[0]);
                return 1;
            } else {
                mode = parseGameMode(arg);
            }
        }
    } catch (const invalid_argument& e) {
        cerr << "Error: " << e.what() << endl;
        printUsage(argv[0]);
        return 1;
    }

    DetectorConfig config;
    try {
        if (!configPath.empty()) {
            config = parseDetectorConfigJson(readTextFile(configPath));
        }
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    vector<fs::path> images;
    if (fs::is_directory(input)) {
        for (const auto& entry : fs::directory_iterator(input)) {
            if (entry.is_regular_file() && isImageFile(entry.path())) {
                images.push_back(entry.path());
            }
        }
        std::sort(images.begin(), images.end());
    } else {
        images.emplace_back(input);
    }

    if (images.empty()) {
        cerr << "Error: No images found in " << input << endl;
        return 1;
    }

    try {
        if (!annotateDir.empty()) {
            fs::create_directories(annotateDir);
        }
        BallFinder finder(config);
        int failures = 0;

        for (const auto& path : images) {
            cerr << "--- " << path.string() << " (" << gameModeToString(mode) << ") ---" << endl;
            DetectionResult result;
            try {
                result = finder.detectFile(path.string(), mode);
            } catch (const ImageDecodeError& e) {
                cerr << "Error: " << e.what() << endl;
                ++failures;
                continue;
            }

            cout << formatDetectionResultJson(result) << endl;
            cerr << "Found " << result.balls.size() << " balls in " << result.processingTimeMs
                 << " ms" << endl;

            if (!annotateDir.empty()) {
                // Same decode path as the detector, so overlays share its frame.
                Mat image;
                try {
                    cvtColor(ImageLoader::loadFile(path.string()), image, COLOR_RGBA2BGR);
                } catch (const ImageDecodeError& e) {
                    cerr << "Error: Could not reopen " << path.string() << " for annotation: "
                         << e.what() << endl;
                    ++failures;
                    continue;
                }
                drawDetections(image, result);
                fs::path outPath = fs::path(annotateDir) / (path.stem().string() + "_balls.png");
                if (!imwrite(outPath.string(), image)) {
                    cerr << "Error: Could not write " << outPath.string() << endl;
                    ++failures;
                    continue;
                }
                cerr << "Annotated image written to " << outPath.string() << endl;
            }
        }

        return failures > 0 ? 2 : 0;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
}
