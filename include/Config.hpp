#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace pgframe {

// What insertTable does when the target exists and overwrite is false
enum class ExistingTablePolicy {
    Truncate,
    Fail
};

ExistingTablePolicy parseExistingTablePolicy(const std::string& value);
std::string existingTablePolicyToString(ExistingTablePolicy policy);

struct ConnectionConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user;
    std::string password;
    std::string database;

    // SSL options
    bool use_ssl = false;
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;

    std::chrono::milliseconds connect_timeout{5000};
    std::string application_name = "pgframe";
};

struct ClientConfig {
    bool auto_commit = true;
    size_t batch_size = 1000;
    ExistingTablePolicy existing_table_policy = ExistingTablePolicy::Truncate;
    std::string default_schema = "public";
};

struct LoggingConfig {
    bool debug = false;
    std::string log_file;
};

// Command selected on the pgframe command line
struct CommandConfig {
    std::string name;
    std::string sql;
    std::string input_file;
    std::string target;
    std::string schema;
    std::string format = "csv";
    bool overwrite = false;
};

struct Config {
    ConnectionConfig connection;
    ClientConfig client;
    LoggingConfig logging;
    CommandConfig command;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Read PG_HOST, PG_PORT, PG_DBNAME, PG_USER and PG_PASSWORD into a value
    static Config fromEnvironment();

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;
};

}  // namespace pgframe
