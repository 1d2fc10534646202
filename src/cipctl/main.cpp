// EN: cipctl: command line front-end for previewing and ingesting delimited files.
// FR: cipctl : interface en ligne de commande pour l'aperçu et l'ingestion de fichiers délimités.

#include "csv/field_mapping.hpp"
#include "csv/parse_config.hpp"
#include "csv/preview_engine.hpp"
#include "csv/streaming_processor.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "io/file_resource.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <future>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

const char* const VERSION = "1.0.0";

struct CliOptions {
    std::string command;
    std::string file;
    std::optional<std::string> config_file;
    std::optional<std::string> encoding;
    std::optional<std::string> delimiter;
    std::optional<std::string> log_level;
    std::optional<size_t> chunk_size;
    std::string mapping;
    bool has_headers{false};
    bool gzip{false};
    bool quiet{false};
};

void printUsage() {
    std::cout << "Usage: cipctl [OPTIONS] COMMAND FILE" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  preview   Show the first rows and detected dialect as JSON" << std::endl;
    std::cout << "  ingest    Stream the whole file through the field mapping" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config FILE        YAML configuration (sections parser, logging)" << std::endl;
    std::cout << "  --encoding ENC       Source encoding (utf-8, utf-16le, utf-16be, latin1, windows-1252)" << std::endl;
    std::cout << "  --delimiter D        Field delimiter (default: auto-detect)" << std::endl;
    std::cout << "  --chunk-size N       Raw bytes per chunk" << std::endl;
    std::cout << "  --map F=I[,F=I...]   Field to column assignment (ingest); F=- leaves F unassigned" << std::endl;
    std::cout << "  --headers            First row is a header (ingest)" << std::endl;
    std::cout << "  --gzip               Read a gzip compressed file" << std::endl;
    std::cout << "  --log-level LEVEL    debug, info, warn, error" << std::endl;
    std::cout << "  --quiet              Only log errors" << std::endl;
    std::cout << "  --version, --help" << std::endl;
}

// EN: Returns false (after printing why) on a malformed command line
// FR: Retourne false (après avoir affiché pourquoi) si la ligne de commande est invalide
bool parseArguments(int argc, char* argv[], CliOptions& options) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const std::string& name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config" || arg == "--encoding" || arg == "--delimiter" || arg == "--log-level" ||
            arg == "--map" || arg == "--chunk-size") {
            auto value = needValue(arg);
            if (!value) return false;
            if (arg == "--config") options.config_file = *value;
            else if (arg == "--encoding") options.encoding = *value;
            else if (arg == "--delimiter") options.delimiter = *value;
            else if (arg == "--log-level") options.log_level = *value;
            else if (arg == "--map") options.mapping = *value;
            else {
                try {
                    long long size = std::stoll(*value);
                    if (size <= 0) throw std::invalid_argument("not positive");
                    options.chunk_size = static_cast<size_t>(size);
                } catch (const std::exception&) {
                    std::cerr << "Invalid --chunk-size: " << *value << std::endl;
                    return false;
                }
            }
        } else if (arg == "--headers") {
            options.has_headers = true;
        } else if (arg == "--gzip") {
            options.gzip = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        std::cerr << "Expected COMMAND and FILE" << std::endl;
        return false;
    }
    options.command = positional[0];
    options.file = positional[1];
    return true;
}

// EN: "email=1,name=0,notes=-" -> assignment map
// FR: "email=1,name=0,notes=-" -> table d'affectation
bool parseMapping(const std::string& text, CIP::CSV::FieldAssignmentMap& assignments) {
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty()) continue;
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Invalid mapping entry: " << item << std::endl;
            return false;
        }
        std::string name = item.substr(0, eq);
        std::string index = item.substr(eq + 1);
        if (index == "-" || index.empty()) {
            assignments[name] = std::nullopt;
            continue;
        }
        try {
            long long value = std::stoll(index);
            if (value < 0) throw std::invalid_argument("negative");
            assignments[name] = static_cast<size_t>(value);
        } catch (const std::exception&) {
            std::cerr << "Invalid column index for " << name << ": " << index << std::endl;
            return false;
        }
    }
    return true;
}

bool configureLogging(const CliOptions& options) {
    auto& logger = CIP::Logger::getInstance();
    auto& config = CIP::ConfigManager::getInstance();

    std::string level_name = config.get("logging", "level").asOrDefault<std::string>("warn");
    if (options.log_level) {
        level_name = *options.log_level;
    }
    if (options.quiet) {
        level_name = "error";
    }

    CIP::LogLevel level;
    if (!CIP::parseLogLevel(level_name, level)) {
        std::cerr << "Invalid log level: " << level_name << std::endl;
        return false;
    }
    logger.setLogLevel(level);

    std::string log_file = config.get("logging", "file").asOrDefault<std::string>("");
    if (log_file.empty()) {
        // EN: stdout carries command output, logs go to stderr
        // FR: stdout porte la sortie des commandes, les logs vont sur stderr
        logger.setSink([](CIP::LogLevel, const std::string& line) {
            std::cerr << line << std::endl;
        });
    } else if (!logger.setOutputFile(log_file)) {
        std::cerr << "Cannot open log file: " << log_file << std::endl;
        return false;
    }
    return true;
}

nlohmann::json previewToJson(const CIP::CSV::PreviewOutcome& outcome) {
    nlohmann::json result;
    if (const auto* failure = std::get_if<CIP::CSV::PreviewFailure>(&outcome)) {
        result["file"] = failure->file ? failure->file->name() : "";
        result["ok"] = false;
        result["error"] = CIP::errorToString(failure->error.code);
        result["message"] = failure->error.message;
        return result;
    }

    const auto& report = std::get<CIP::CSV::PreviewReport>(outcome);
    result["file"] = report.file->name();
    result["ok"] = true;
    result["is_single_line"] = report.is_single_line;
    result["first_chunk_length"] = report.first_chunk.size();
    result["rows"] = report.first_rows;
    if (report.first_warning) {
        result["warning"] = report.first_warning->toString();
    }

    nlohmann::json columns = nlohmann::json::array();
    for (const auto& summary : CIP::CSV::summarizeColumns(report, false)) {
        columns.push_back({{"index", summary.index}, {"kind", CIP::CSV::cellKindToString(summary.kind)}});
    }
    result["columns"] = columns;
    return result;
}

int runPreview(const CIP::IO::FileRef& file, const CIP::CSV::ParseConfig& config) {
    auto outcome = CIP::CSV::preview(file, config);
    std::cout << previewToJson(outcome).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return CIP::CSV::isSuccess(outcome) ? 0 : 1;
}

int runIngest(const CliOptions& options, const CIP::IO::FileRef& file, const CIP::CSV::ParseConfig& config) {
    CIP::CSV::ParserInput input;
    input.file = file;
    input.config = config;
    input.has_headers = options.has_headers;
    if (!parseMapping(options.mapping, input.field_assignments)) {
        return 2;
    }
    if (input.field_assignments.empty()) {
        std::cerr << "ingest requires --map" << std::endl;
        return 2;
    }

    size_t seen = 0;
    auto on_progress = [&seen](size_t delta) {
        seen += delta;
    };
    auto on_batch = [&seen](std::vector<CIP::CSV::Record> records, const CIP::CSV::BatchInfo& info) {
        std::cout << "batch start=" << info.start_index << " size=" << records.size()
                  << " seen=" << seen << std::endl;
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    };

    auto result = CIP::CSV::process(input, on_progress, on_batch);
    std::cout << result.statistics.generateReport();
    if (!result.ok()) {
        std::cerr << "Ingest failed: " << result.toErrorInfo().toString() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "--version" || arg == "-v") {
            std::cout << "cipctl " << VERSION << std::endl;
            std::cout << "Build: " << __DATE__ << " " << __TIME__ << std::endl;
            return 0;
        }
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
    }

    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return 2;
    }

    auto& config_manager = CIP::ConfigManager::getInstance();
    if (options.config_file && !config_manager.loadFromFile(*options.config_file)) {
        std::cerr << "Cannot load configuration: " << *options.config_file << std::endl;
        return 2;
    }
    // EN: Overrides only target known sections
    // FR: Les surcharges ne visent que les sections connues
    for (const char* section : {"parser", "logging"}) {
        auto names = config_manager.getSectionNames();
        if (std::find(names.begin(), names.end(), section) == names.end()) {
            config_manager.setSection(section, CIP::ConfigSection());
        }
    }
    config_manager.loadEnvironmentOverrides();

    config_manager.addValidationRules({
        {"logging.level", "string", false, std::nullopt, std::nullopt, {"debug", "info", "warn", "error"}, "Log level"},
        {"parser.chunk_size", "int", false, 1.0, std::nullopt, {}, "Raw bytes per chunk"},
        {"parser.max_row_size", "int", false, 1.0, std::nullopt, {}, "Largest pending row"},
        {"parser.max_field_size", "int", false, 1.0, std::nullopt, {}, "Largest cell"}
    });
    std::vector<std::string> config_errors;
    if (!config_manager.validate(config_errors)) {
        for (const auto& error : config_errors) {
            std::cerr << "Configuration error: " << error << std::endl;
        }
        return 2;
    }

    if (!configureLogging(options)) {
        return 2;
    }

    try {
        CIP::CSV::ParseConfig config = CIP::CSV::loadParseConfig();
        if (options.encoding) config.encoding = *options.encoding;
        if (options.delimiter) config.delimiter = *options.delimiter;
        if (options.chunk_size) config.chunk_size = *options.chunk_size;
        CIP::CSV::validateParseConfig(config);

        CIP::IO::FileRef file = options.gzip ? CIP::IO::openGzipFile(options.file)
                                             : CIP::IO::openLocalFile(options.file);

        LOG_INFO("cipctl", "Running " + options.command + " on " + options.file);

        if (options.command == "preview") {
            return runPreview(file, config);
        }
        if (options.command == "ingest") {
            return runIngest(options, file, config);
        }
        std::cerr << "Unknown command: " << options.command << std::endl;
        printUsage();
        return 2;

    } catch (const CIP::IngestException& e) {
        LOG_ERROR("cipctl", e.toErrorInfo().toString());
        std::cerr << e.toErrorInfo().toString() << std::endl;
        return 1;
    }
}
