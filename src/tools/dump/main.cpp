/// @file main.cpp
/// @brief gm_dump entry point.
///
/// Reads a YAML document, builds the value graph on a heap and writes its
/// marshal stream to a file:
///
///   gm_dump [--config FILE] INPUT.yaml OUTPUT.bin

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "gm/foundation/config_manager.hpp"
#include "gm/foundation/marshal_logger.hpp"
#include "gm/marshal/byte_sink.hpp"
#include "gm/marshal/marshal_options.hpp"
#include "gm/marshal/marshal_writer.hpp"
#include "gm/model/document_loader.hpp"
#include "gm/model/heap.hpp"
#include "gm/version.hpp"

namespace {

using gm::foundation::LogCategory;
using gm::foundation::MarshalError;

struct Arguments {
    std::filesystem::path configPath;
    std::filesystem::path input;
    std::filesystem::path output;
};

void printUsage(std::ostream& os) {
    os << "usage: gm_dump [--config FILE] INPUT.yaml OUTPUT.bin\n";
}

int fail(const MarshalError& error) {
    std::cerr << "gm_dump: [" << error.subsystem() << "] " << error.describe() << "\n";
    return EXIT_FAILURE;
}

bool parseArguments(int argc, char* argv[], Arguments& args) {
    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return false;
            }
            args.configPath = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) {
        return false;
    }
    args.input = positional[0];
    args.output = positional[1];
    return true;
}

/// Load the config named by --config, overridden by GM_CONFIG_PATH.
/// No config at all leaves every option at its default.
gm::foundation::MarshalResult<void> loadConfig(gm::foundation::ConfigManager& config,
                                               std::filesystem::path path) {
    const char* envPath = std::getenv("GM_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        path = envPath;
    }
    if (path.empty()) {
        return gm::foundation::MarshalResult<void>::ok();
    }
    return config.load(path);
}

gm::foundation::MarshalResult<void> applyLogLevel(const gm::foundation::ConfigManager& config) {
    auto levelName = config.getOr<std::string>("logging.level", "info");
    GM_TRY(levelName);
    auto level = gm::foundation::parseLogLevel(levelName.value());
    if (!level) {
        return gm::foundation::MarshalResult<void>::err(
            MarshalError(gm::foundation::ErrorCode::ConfigTypeMismatch,
                         "unknown logging.level '" + levelName.value() + "'"));
    }
    gm::foundation::MarshalLogger::instance().setAllLevels(*level);
    return gm::foundation::MarshalResult<void>::ok();
}

}  // namespace

int main(int argc, char* argv[]) {
    Arguments args;
    if (!parseArguments(argc, argv, args)) {
        printUsage(std::cerr);
        return EXIT_FAILURE;
    }

    gm::foundation::ConfigManager config;
    if (auto loaded = loadConfig(config, args.configPath); !loaded) {
        return fail(loaded.error());
    }
    if (auto applied = applyLogLevel(config); !applied) {
        return fail(applied.error());
    }
    auto options = gm::marshal::marshalOptionsFromConfig(config);
    if (!options) {
        return fail(options.error());
    }

    gm::model::Heap heap;
    gm::model::DocumentLoader loader(heap);
    auto root = loader.loadFile(args.input);
    if (!root) {
        return fail(root.error());
    }

    auto sink = gm::marshal::FileSink::open(args.output);
    if (!sink) {
        return fail(sink.error());
    }

    auto written = gm::marshal::serialize(*root.value(), *sink.value(), options.value(), &heap);
    if (!written) {
        return fail(written.error());
    }
    if (auto closed = sink.value()->close(); !closed) {
        return fail(closed.error());
    }

    GM_LOG_INFO(LogCategory::Tool,
                "gm_dump " GM_VERSION_STRING ": wrote " +
                    std::to_string(sink.value()->bytesWritten()) + " bytes to " +
                    args.output.string());
    return EXIT_SUCCESS;
}
