#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pgframe {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

void applyEnv(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) {
        target = value;
    }
}

}  // namespace

ExistingTablePolicy parseExistingTablePolicy(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "truncate") return ExistingTablePolicy::Truncate;
    if (lower == "fail") return ExistingTablePolicy::Fail;

    throw std::invalid_argument("Unknown existing table policy: " + value);
}

std::string existingTablePolicyToString(ExistingTablePolicy policy) {
    switch (policy) {
        case ExistingTablePolicy::Truncate: return "truncate";
        case ExistingTablePolicy::Fail: return "fail";
    }
    return "truncate";
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (current_section == "connection") {
            if (key == "host") config.connection.host = value;
            else if (key == "port") config.connection.port = static_cast<uint16_t>(std::stoi(value));
            else if (key == "user") config.connection.user = value;
            else if (key == "password") config.connection.password = value;
            else if (key == "database" || key == "dbname") config.connection.database = value;
            else if (key == "use_ssl") config.connection.use_ssl = parseBool(value);
            else if (key == "ssl_ca") config.connection.ssl_ca = value;
            else if (key == "ssl_cert") config.connection.ssl_cert = value;
            else if (key == "ssl_key") config.connection.ssl_key = value;
            else if (key == "connect_timeout")
                config.connection.connect_timeout = std::chrono::milliseconds(std::stoi(value));
            else if (key == "application_name") config.connection.application_name = value;
        }
        else if (current_section == "client") {
            if (key == "auto_commit")
                config.client.auto_commit = parseBool(value);
            else if (key == "batch_size")
                config.client.batch_size = static_cast<size_t>(std::stoul(value));
            else if (key == "existing_table_policy")
                config.client.existing_table_policy = parseExistingTablePolicy(value);
            else if (key == "default_schema")
                config.client.default_schema = value;
        }
        else if (current_section == "logging") {
            if (key == "debug") config.logging.debug = parseBool(value);
            else if (key == "log_file") config.logging.log_file = value;
        }
    }

    return config;
}

Config Config::fromEnvironment() {
    Config config;

    applyEnv("PG_HOST", config.connection.host);
    applyEnv("PG_DBNAME", config.connection.database);
    applyEnv("PG_USER", config.connection.user);
    applyEnv("PG_PASSWORD", config.connection.password);

    const char* port = std::getenv("PG_PORT");
    if (port && *port) {
        config.connection.port = static_cast<uint16_t>(std::stoi(port));
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config = fromEnvironment();

    CLI::App app{"pgframe - move tables between CSV files and PostgreSQL"};
    app.require_subcommand(1);

    // Connection options
    app.add_option("-H,--host", config.connection.host, "Database server host")
        ->capture_default_str();
    app.add_option("-P,--port", config.connection.port, "Database server port")
        ->capture_default_str();
    app.add_option("-u,--user", config.connection.user, "Database username");
    app.add_option("-p,--password", config.connection.password,
                   "Database password (or use PG_PASSWORD env)");
    app.add_option("-D,--database", config.connection.database, "Database name");

    // SSL options
    app.add_flag("--ssl", config.connection.use_ssl, "Require SSL connection");
    app.add_option("--ssl-ca", config.connection.ssl_ca, "SSL CA certificate file");
    app.add_option("--ssl-cert", config.connection.ssl_cert, "SSL client certificate file");
    app.add_option("--ssl-key", config.connection.ssl_key, "SSL client key file");

    // Client options
    app.add_flag("--no-auto-commit", [&config](int64_t) { config.client.auto_commit = false; },
                 "Leave transactions open (statements are rolled back on exit)");
    std::string policy = existingTablePolicyToString(config.client.existing_table_policy);
    app.add_option("--existing-table", policy,
                   "What load does with an existing table without --overwrite (truncate, fail)")
        ->check(CLI::IsMember({"truncate", "fail"}))
        ->capture_default_str();

    app.add_flag("-d,--debug", config.logging.debug, "Enable debug output");
    app.add_option("--log-file", config.logging.log_file, "Also log to this file");

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    auto* query = app.add_subcommand("query", "Run SQL and print the last result");
    query->add_option("sql", config.command.sql, "SQL text, statements separated by ';'")
        ->required();
    query->add_option("-f,--format", config.command.format, "Output format (csv, json)")
        ->check(CLI::IsMember({"csv", "json"}))
        ->capture_default_str();

    auto* load = app.add_subcommand("load", "Load a CSV or JSON file into a table");
    load->add_option("file", config.command.input_file,
                     "CSV file with a header row, or a JSON array of objects")
        ->required()
        ->check(CLI::ExistingFile);
    load->add_option("table", config.command.target, "Target table (schema.table or table)")
        ->required();
    load->add_option("-f,--format", config.command.format, "Input format (csv, json)")
        ->check(CLI::IsMember({"csv", "json"}))
        ->capture_default_str();
    load->add_flag("--overwrite", config.command.overwrite, "Drop and recreate the table");
    load->add_option("-b,--batch-size", config.client.batch_size, "Rows per transaction")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_subcommand("schemas", "List schemas");

    auto* tables = app.add_subcommand("tables", "List tables of a schema");
    tables->add_option("schema", config.command.schema, "Schema name")
        ->default_val("public");

    auto* describe = app.add_subcommand("describe", "Show the columns of a table");
    describe->add_option("table", config.command.target, "Table (schema.table or table)")
        ->required();
    describe->add_option("-f,--format", config.command.format, "Output format (csv, json)")
        ->check(CLI::IsMember({"csv", "json"}))
        ->capture_default_str();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    for (auto* sub : app.get_subcommands()) {
        config.command.name = sub->get_name();
    }

    config.client.existing_table_policy = parseExistingTablePolicy(policy);

    // Command line args override file config, file config overrides the environment
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            const Config defaults;
            const Config& file = *file_config;

            auto given = [](const CLI::App* owner, const std::string& name) {
                return owner->get_option(name)->count() > 0;
            };
            // Values the file leaves at their defaults do not mask the environment
            auto merge = [](auto& target, const auto& fileValue, const auto& defaultValue) {
                if (fileValue != defaultValue) target = fileValue;
            };

            auto& conn = config.connection;
            if (!given(&app, "--host")) {
                merge(conn.host, file.connection.host, defaults.connection.host);
            }
            if (!given(&app, "--port")) {
                merge(conn.port, file.connection.port, defaults.connection.port);
            }
            if (!given(&app, "--user")) {
                merge(conn.user, file.connection.user, defaults.connection.user);
            }
            if (!given(&app, "--password")) {
                merge(conn.password, file.connection.password, defaults.connection.password);
            }
            if (!given(&app, "--database")) {
                merge(conn.database, file.connection.database, defaults.connection.database);
            }
            if (!given(&app, "--ssl")) {
                merge(conn.use_ssl, file.connection.use_ssl, defaults.connection.use_ssl);
            }
            if (!given(&app, "--ssl-ca")) {
                merge(conn.ssl_ca, file.connection.ssl_ca, defaults.connection.ssl_ca);
            }
            if (!given(&app, "--ssl-cert")) {
                merge(conn.ssl_cert, file.connection.ssl_cert, defaults.connection.ssl_cert);
            }
            if (!given(&app, "--ssl-key")) {
                merge(conn.ssl_key, file.connection.ssl_key, defaults.connection.ssl_key);
            }
            merge(conn.connect_timeout, file.connection.connect_timeout,
                  defaults.connection.connect_timeout);
            merge(conn.application_name, file.connection.application_name,
                  defaults.connection.application_name);

            if (!given(&app, "--no-auto-commit")) {
                merge(config.client.auto_commit, file.client.auto_commit,
                      defaults.client.auto_commit);
            }
            if (!given(load, "--batch-size")) {
                merge(config.client.batch_size, file.client.batch_size,
                      defaults.client.batch_size);
            }
            if (!given(&app, "--existing-table")) {
                merge(config.client.existing_table_policy, file.client.existing_table_policy,
                      defaults.client.existing_table_policy);
            }
            merge(config.client.default_schema, file.client.default_schema,
                  defaults.client.default_schema);

            if (!given(&app, "--debug")) {
                merge(config.logging.debug, file.logging.debug, defaults.logging.debug);
            }
            if (!given(&app, "--log-file")) {
                merge(config.logging.log_file, file.logging.log_file, defaults.logging.log_file);
            }
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    return config;
}

bool Config::validate() const {
    if (connection.host.empty()) {
        spdlog::error("Database host is required (use -H option)");
        return false;
    }

    if (connection.port == 0) {
        spdlog::error("Database port must be non-zero");
        return false;
    }

    if (client.batch_size == 0) {
        spdlog::error("Batch size must be at least 1");
        return false;
    }

    if (client.default_schema.empty()) {
        spdlog::error("Default schema must not be empty");
        return false;
    }

    if (connection.use_ssl) {
        if (!connection.ssl_ca.empty() && !std::filesystem::exists(connection.ssl_ca)) {
            spdlog::error("SSL CA file not found: {}", connection.ssl_ca);
            return false;
        }
        if (!connection.ssl_cert.empty() && !std::filesystem::exists(connection.ssl_cert)) {
            spdlog::error("SSL certificate file not found: {}", connection.ssl_cert);
            return false;
        }
        if (!connection.ssl_key.empty() && !std::filesystem::exists(connection.ssl_key)) {
            spdlog::error("SSL key file not found: {}", connection.ssl_key);
            return false;
        }
    }

    return true;
}

}  // namespace pgframe
