// =================================================================
// tests/ConfigTest.cpp
// =================================================================
// Unit tests for ConfigParser, BackupConfig, CliParser and the log file sink.

#include "SafeBackup/BackupConfig.hpp"
#include "SafeBackup/BackupError.hpp"
#include "SafeBackup/CliParser.hpp"
#include "SafeBackup/ConfigParser.hpp"
#include "SafeBackup/Logger.hpp"
#include "TestWorkspace.hpp"
#include <iostream>
#include <fstream>
#include <iterator>
#include <cassert>

class ConfigTest {
public:
    void testMissingFileUsesDefaults() {
        std::cout << "Testing missing configuration file..." << std::endl;

        TestWorkspace ws("config_missing");
        SafeBackup::ConfigParser parser(ws.path("config.yml").string());
        assert(!parser.isLoaded());
        assert(parser.getStringValue("activity_log").empty());

        SafeBackup::BackupConfig config;
        config.loadFromConfig(parser);
        assert(config.activity_log == "logfile.txt");
        assert(config.working_directory.empty());
        assert(config.console_log_level == SafeBackup::LogLevel::ERROR);
        assert(config.file_logging);
        assert(config.validate().empty());

        std::cout << "✓ Missing file test passed" << std::endl;
    }

    void testLoadsValues() {
        std::cout << "Testing configuration values..." << std::endl;

        TestWorkspace ws("config_values");
        ws.write("config.yml", R"(# SafeBackup configuration
working_directory: /srv/data
activity_log: audit.jsonl
user: backup-bot
logging:
  dir: /var/log/safe_backup
  console_level: warning
  file: false
)");

        SafeBackup::ConfigParser parser(ws.path("config.yml").string());
        assert(parser.isLoaded());
        assert(parser.hasValue("logging.dir"));
        assert(parser.getStringValue("logging.console_level") == "warning");

        SafeBackup::BackupConfig config;
        config.loadFromConfig(parser);
        assert(config.working_directory == "/srv/data");
        assert(config.activity_log == "audit.jsonl");
        assert(config.user == "backup-bot");
        assert(config.log_dir == "/var/log/safe_backup");
        assert(config.console_log_level == SafeBackup::LogLevel::WARNING);
        assert(!config.file_logging);
        assert(config.validate().empty());

        std::cout << "✓ Configuration values test passed" << std::endl;
    }

    void testInvalidValuesKeepDefaults() {
        std::cout << "Testing invalid configuration values..." << std::endl;

        TestWorkspace ws("config_invalid_values");
        ws.write("config.yml", "logging:\n  console_level: loud\n  file: maybe\n");

        SafeBackup::ConfigParser parser(ws.path("config.yml").string());
        SafeBackup::BackupConfig config;
        config.loadFromConfig(parser);

        assert(config.console_log_level == SafeBackup::LogLevel::ERROR);
        assert(config.file_logging);

        std::cout << "✓ Invalid values test passed" << std::endl;
    }

    void testMalformedYaml() {
        std::cout << "Testing malformed YAML..." << std::endl;

        TestWorkspace ws("config_malformed");
        ws.write("config.yml", "activity_log: [unclosed\n");

        bool threw = false;
        try {
            SafeBackup::ConfigParser parser(ws.path("config.yml").string());
        } catch (const SafeBackup::BackupError& e) {
            threw = e.kind() == SafeBackup::ErrorKind::INVALID_INPUT;
        }
        assert(threw && "Malformed YAML must be reported");

        std::cout << "✓ Malformed YAML test passed" << std::endl;
    }

    void testCommandOverrides() {
        std::cout << "Testing command-line overrides..." << std::endl;

        SafeBackup::BackupConfig config;
        config.working_directory = "/from/config";

        SafeBackup::Commands commands;
        commands.directory = "/from/cli";
        commands.verbose = true;
        config.applyCommandOverrides(commands);

        assert(config.working_directory == "/from/cli");
        assert(config.console_log_level == SafeBackup::LogLevel::DEBUG);

        SafeBackup::BackupConfig untouched;
        untouched.applyCommandOverrides(SafeBackup::Commands());
        assert(untouched.working_directory.empty());
        assert(untouched.console_log_level == SafeBackup::LogLevel::ERROR);

        std::cout << "✓ Command overrides test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing configuration validation..." << std::endl;

        SafeBackup::BackupConfig config;
        config.activity_log = "";
        assert(!config.validate().empty());

        config.activity_log = "/tmp/log.txt";
        assert(!config.validate().empty());

        config.activity_log = "logs/log.txt";
        assert(!config.validate().empty());

        config.activity_log = "..";
        assert(!config.validate().empty());

        config.activity_log = "log.txt";
        assert(config.validate().empty());

        config.log_dir = "";
        assert(!config.validate().empty());
        config.file_logging = false;
        assert(config.validate().empty());

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testLevelParsing() {
        std::cout << "Testing log level parsing..." << std::endl;

        SafeBackup::LogLevel level = SafeBackup::LogLevel::INFO;
        assert(SafeBackup::Logger::parseLevel("DEBUG", level) && level == SafeBackup::LogLevel::DEBUG);
        assert(SafeBackup::Logger::parseLevel("warn", level) && level == SafeBackup::LogLevel::WARNING);
        assert(SafeBackup::Logger::parseLevel("Critical", level) && level == SafeBackup::LogLevel::CRITICAL);
        assert(!SafeBackup::Logger::parseLevel("verbose", level));
        assert(level == SafeBackup::LogLevel::CRITICAL);

        std::cout << "✓ Level parsing test passed" << std::endl;
    }

    void testPathsFollowWorkingDirectory() {
        std::cout << "Testing paths anchored at the working directory..." << std::endl;

        SafeBackup::BackupConfig config;
        assert(config.logDirectoryIn("/srv/data") == fs::path("/srv/data/.safe_backup/logs"));
        config.log_dir = "/var/log/safe_backup";
        assert(config.logDirectoryIn("/srv/data") == fs::path("/var/log/safe_backup"));

        SafeBackup::Commands commands;
        assert(SafeBackup::BackupConfig::configPathFor(commands) == fs::path(".safe_backup/config.yml"));
        commands.directory = "/srv/data";
        assert(SafeBackup::BackupConfig::configPathFor(commands) ==
               fs::path("/srv/data/.safe_backup/config.yml"));
        commands.config_path = "/etc/safe_backup.yml";
        assert(SafeBackup::BackupConfig::configPathFor(commands) == fs::path("/etc/safe_backup.yml"));

        std::cout << "✓ Working directory paths test passed" << std::endl;
    }

    void testLogFileOutput() {
        std::cout << "Testing diagnostic log file output..." << std::endl;

        TestWorkspace ws("config_log_file");
        SafeBackup::BackupConfig config;
        fs::path log_dir = config.logDirectoryIn(ws.dir());

        SafeBackup::Logger& logger = SafeBackup::Logger::getInstance();
        logger.initialize(log_dir.string());
        std::string log_file = logger.currentLogFile();
        assert(!log_file.empty());
        assert(fs::path(log_file).parent_path() == log_dir);

        logger.logOperation("backup", "notes.md", true, "notes.md.1700000000.bak");
        logger.flush();

        std::ifstream in(log_file);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(content.find("backup completed") != std::string::npos);
        assert(content.find("File: notes.md") != std::string::npos);

        logger.shutdown();
        assert(logger.currentLogFile().empty());

        std::cout << "✓ Log file output test passed" << std::endl;
    }

    void testCommandLineParsing() {
        std::cout << "Testing command line parsing..." << std::endl;

        {
            SafeBackup::CliParser parser;
            auto app = parser.setupCli();
            app->parse("backup notes.md --verbose");
            const auto& commands = parser.getCommands();
            assert(commands.active_command == "backup");
            assert(commands.file_name == "notes.md");
            assert(commands.verbose);
            assert(commands.config_path == ".safe_backup/config.yml");
        }

        {
            SafeBackup::CliParser parser;
            auto app = parser.setupCli();
            app->parse("");
            assert(parser.getCommands().active_command.empty());
        }

        {
            SafeBackup::CliParser parser;
            auto app = parser.setupCli();
            bool rejected = false;
            try {
                app->parse("restore");
            } catch (const CLI::ParseError&) {
                rejected = true;
            }
            assert(rejected);
        }

        std::cout << "✓ Command line parsing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running configuration unit tests..." << std::endl;

        testMissingFileUsesDefaults();
        testLoadsValues();
        testInvalidValuesKeepDefaults();
        testMalformedYaml();
        testCommandOverrides();
        testValidation();
        testLevelParsing();
        testPathsFollowWorkingDirectory();
        testLogFileOutput();
        testCommandLineParsing();

        std::cout << "All configuration tests passed!" << std::endl;
    }
};

int main() {
    SafeBackup::Logger::getInstance().setConsoleLogging(false);

    try {
        ConfigTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All configuration component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
