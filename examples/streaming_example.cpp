#include "csv/preview_engine.hpp"
#include "csv/streaming_processor.hpp"
#include "infrastructure/logging/logger.hpp"
#include "io/file_resource.hpp"
#include <chrono>
#include <future>
#include <iostream>
#include <thread>

int main() {
    auto& logger = CIP::Logger::getInstance();
    logger.setLogLevel(CIP::LogLevel::INFO);

    LOG_INFO("streaming_example", "CSV Ingest Pipeline streaming example");

    // Build an in-memory file with a BOM, a header and 25 data rows
    std::string content = "\xEF\xBB\xBFid;name;email\n";
    for (int i = 1; i <= 25; ++i) {
        content += std::to_string(i) + ";user" + std::to_string(i) + ";user" + std::to_string(i) + "@example.com\n";
    }
    auto file = CIP::IO::makeMemoryFile("users.csv", content);

    CIP::CSV::ParseConfig config;
    config.chunk_size = 128;

    // Preview first to find the columns
    auto outcome = CIP::CSV::preview(file, config);
    if (!CIP::CSV::isSuccess(outcome)) {
        LOG_ERROR("streaming_example", std::get<CIP::CSV::PreviewFailure>(outcome).error.toString());
        return 1;
    }
    const auto& report = std::get<CIP::CSV::PreviewReport>(outcome);
    std::cout << "Header: ";
    for (const auto& cell : report.first_rows.front()) {
        std::cout << "[" << cell << "] ";
    }
    std::cout << std::endl;

    CIP::CSV::ParserInput input;
    input.file = file;
    input.config = config;
    input.has_headers = true;
    input.field_assignments = {{"email", 2}, {"name", 1}, {"phone", std::nullopt}};

    // A slow consumer: decoding stays paused while each batch is "saved"
    auto on_batch = [](std::vector<CIP::CSV::Record> records, const CIP::CSV::BatchInfo& info) {
        return std::async(std::launch::async, [records = std::move(records), info]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            std::cout << "Saved " << records.size() << " records from index " << info.start_index
                      << " (first: " << records.front().at("email") << ")" << std::endl;
        });
    };

    size_t seen = 0;
    auto result = CIP::CSV::processAsync(input, [&seen](size_t delta) { seen += delta; }, on_batch).get();

    if (!result.ok()) {
        LOG_ERROR("streaming_example", "Streaming failed: " + result.message);
        return 1;
    }

    std::cout << result.statistics.generateReport();
    LOG_INFO("streaming_example", "Streaming example completed, " + std::to_string(seen) + " rows seen");
    return 0;
}
