#include "Client.hpp"
#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

using namespace pgframe;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Results go to stdout, so log lines go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("pgframe", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printTable(const Table& table, const std::string& format) {
    if (format == "json") {
        std::cout << FormatConverter::toJSON(table) << std::endl;
    } else {
        std::cout << FormatConverter::toCSV(table);
    }
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int runCommand(Client& client, const CommandConfig& command) {
    if (command.name == "query") {
        auto result = client.query(command.sql);
        if (result) {
            printTable(*result, command.format);
        } else {
            std::cerr << "OK" << std::endl;
        }
        return 0;
    }

    if (command.name == "load") {
        std::string data = readFile(command.input_file);
        Table table = command.format == "json" ? FormatConverter::parseJSON(data)
                                               : FormatConverter::parseCSV(data);
        size_t rows = client.insertTable(table, command.target, command.overwrite);
        std::cerr << "Loaded " << rows << " rows into " << command.target << std::endl;
        return 0;
    }

    if (command.name == "schemas") {
        printTable(client.listSchemas(), command.format);
        return 0;
    }

    if (command.name == "tables") {
        printTable(client.listTables(command.schema), command.format);
        return 0;
    }

    if (command.name == "describe") {
        if (!client.tableExists(command.target)) {
            std::cerr << "Table not found: " << command.target << std::endl;
            return 1;
        }
        printTable(client.describeTable(command.target), command.format);
        return 0;
    }

    std::cerr << "Unknown command: " << command.name << std::endl;
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.logging.debug, config.logging.log_file);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    spdlog::info("Connecting to {}:{}/{} as {}", config.connection.host,
                 config.connection.port, config.connection.database, config.connection.user);

    try {
        Client client(config);
        return runCommand(client, config.command);
    } catch (const QueryError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const InsertError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const DatabaseException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
