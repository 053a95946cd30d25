/**
 * @file main.cpp
 * @brief FileHub command line entry point
 *
 * Content-addressable file store with deduplication. Each command prints the
 * JSON body of the corresponding API result on stdout.
 */

#include "filestore/infrastructure/controller/FileStoreController.hpp"
#include "filestore/infrastructure/repository/PostgresFileStoreRepository.hpp"
#include "filestore/infrastructure/repository/InMemoryFileStoreRepository.hpp"
#include "filestore/infrastructure/adapter/LocalBlobStorageAdapter.hpp"
#include "filestore/infrastructure/adapter/InMemoryBlobStorageAdapter.hpp"
#include "shared/lib/config/config_manager.h"
#include "shared/lib/database/db_connection_pool.h"
#include "shared/lib/database/postgresql_query_executor.h"
#include "shared/lib/exception/exceptions.h"
#include "shared/lib/logging/logger.h"

#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using filestore::infrastructure::controller::ApiResult;
using filestore::infrastructure::controller::FileStoreController;
using filestore::application::command::ListFilesCommand;

constexpr int EXIT_OK = 0;
constexpr int EXIT_CLIENT_ERROR = 1;
constexpr int EXIT_SERVER_ERROR = 2;
constexpr int EXIT_USAGE = 64;

/**
 * @brief Malformed command line
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Application configuration
 */
struct AppConfig {
    std::string backend = "postgres";
    std::string blobStoragePath = "./media";
    size_t hashChunkSize = 4096;
    int submitMaxAttempts = 3;
    bool debug = false;
    std::string logLevel = "info";
    std::string logFile;

    size_t poolMin = 1;
    size_t poolMax = 4;
    int acquireTimeoutSec = 5;

    static AppConfig fromConfig(const common::ConfigManager& config) {
        AppConfig app;
        app.backend = config.getString(common::ConfigManager::STORE_BACKEND, app.backend);
        app.blobStoragePath = config.getString(common::ConfigManager::BLOB_STORAGE_PATH, app.blobStoragePath);
        app.submitMaxAttempts = config.getInt(common::ConfigManager::SUBMIT_MAX_ATTEMPTS, app.submitMaxAttempts);
        app.debug = config.getBool(common::ConfigManager::DEBUG, false);
        app.logLevel = config.getString(common::ConfigManager::LOG_LEVEL, app.debug ? "debug" : "info");
        app.logFile = config.getString(common::ConfigManager::LOG_FILE);
        app.acquireTimeoutSec = config.getInt(common::ConfigManager::DB_ACQUIRE_TIMEOUT, app.acquireTimeoutSec);

        int chunk = config.getInt(common::ConfigManager::HASH_CHUNK_SIZE, static_cast<int>(app.hashChunkSize));
        if (chunk <= 0) {
            throw common::ConfigException("HASH_CHUNK_SIZE must be positive");
        }
        app.hashChunkSize = static_cast<size_t>(chunk);

        int poolMin = config.getInt(common::ConfigManager::DB_POOL_MIN, static_cast<int>(app.poolMin));
        int poolMax = config.getInt(common::ConfigManager::DB_POOL_MAX, static_cast<int>(app.poolMax));
        if (poolMin < 0 || poolMax < 1 || poolMin > poolMax) {
            throw common::ConfigException("DB_POOL_MIN/DB_POOL_MAX must satisfy 0 <= min <= max, max >= 1");
        }
        app.poolMin = static_cast<size_t>(poolMin);
        app.poolMax = static_cast<size_t>(poolMax);

        if (app.submitMaxAttempts < 1) {
            throw common::ConfigException("SUBMIT_MAX_ATTEMPTS must be at least 1");
        }
        if (app.backend != "postgres" && app.backend != "memory") {
            throw common::ConfigException("STORE_BACKEND must be 'postgres' or 'memory'");
        }
        return app;
    }
};

/**
 * @brief Parsed command line: command, positionals and --flag values
 */
struct CommandLine {
    std::string command;
    std::vector<std::string> positionals;
    std::map<std::string, std::string> flags;

    static CommandLine parse(int argc, char* argv[]) {
        if (argc < 2) {
            throw UsageError("missing command");
        }

        CommandLine cmd;
        cmd.command = argv[1];
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) == 0) {
                if (i + 1 >= argc) {
                    throw UsageError("flag " + arg + " needs a value");
                }
                cmd.flags[arg.substr(2)] = argv[++i];
            } else {
                cmd.positionals.push_back(arg);
            }
        }
        return cmd;
    }

    std::optional<std::string> flag(const std::string& name) const {
        auto it = flags.find(name);
        if (it == flags.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<int64_t> int64Flag(const std::string& name) const {
        auto value = flag(name);
        if (!value) {
            return std::nullopt;
        }
        try {
            size_t consumed = 0;
            int64_t parsed = std::stoll(*value, &consumed);
            if (consumed != value->size()) {
                throw UsageError("--" + name + " must be an integer");
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw UsageError("--" + name + " must be an integer");
        }
    }

    void allowFlags(std::initializer_list<const char*> allowed) const {
        for (const auto& [name, value] : flags) {
            bool known = false;
            for (const char* candidate : allowed) {
                known = known || name == candidate;
            }
            if (!known) {
                throw UsageError("unknown flag --" + name + " for " + command);
            }
        }
    }

    void expectPositionals(size_t min, size_t max) const {
        if (positionals.size() < min || positionals.size() > max) {
            throw UsageError("wrong number of arguments for " + command);
        }
    }
};

void printUsage() {
    std::cerr <<
        "Usage: filehub <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  upload <path> [--name N] [--type T]   Store a file (or reference identical content)\n"
        "  delete-file <id>                      Delete a stored file without references\n"
        "  delete-reference <id>                 Delete a reference\n"
        "  list [--filename S] [--type T] [--min-size N] [--max-size N]\n"
        "       [--after YYYY-MM-DD] [--before YYYY-MM-DD] [--search S]\n"
        "       [--ordering F] [--page N] [--size N]\n"
        "  references [<fileId>]                 List references\n"
        "  stats                                 Deduplication statistics\n"
        "  backfill [--batch N]                  Hash legacy files without a content hash (N rows per query)\n"
        "  init-schema                           Create the PostgreSQL schema\n"
        "\n"
        "Environment: STORE_BACKEND (postgres|memory), BLOB_STORAGE_PATH, DB_HOST, DB_PORT,\n"
        "  DB_NAME, DB_USER, DB_PASSWORD, DB_POOL_MIN, DB_POOL_MAX, DB_ACQUIRE_TIMEOUT,\n"
        "  HASH_CHUNK_SIZE, SUBMIT_MAX_ATTEMPTS, DEBUG, LOG_LEVEL, LOG_FILE\n";
}

int exitCodeFor(const ApiResult& result) {
    if (result.isSuccess()) {
        return EXIT_OK;
    }
    return result.status >= 500 ? EXIT_SERVER_ERROR : EXIT_CLIENT_ERROR;
}

int printResult(const ApiResult& result) {
    if (!result.body.is_null()) {
        std::cout << result.body.dump(2) << std::endl;
    }
    return exitCodeFor(result);
}

int toInt(const std::optional<int64_t>& value, int fallback, const char* name) {
    if (!value) {
        return fallback;
    }
    if (*value < INT32_MIN || *value > INT32_MAX) {
        throw UsageError(std::string("--") + name + " is out of range");
    }
    return static_cast<int>(*value);
}

int runUpload(FileStoreController& controller, const CommandLine& cmd) {
    cmd.expectPositionals(1, 1);
    cmd.allowFlags({"name", "type"});

    const std::string& path = cmd.positionals[0];
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("Cannot open {}", path);
        return EXIT_CLIENT_ERROR;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    int64_t declaredSize = ec ? -1 : static_cast<int64_t>(size);

    std::string name = cmd.flag("name").value_or(std::filesystem::path(path).filename().string());
    std::string type = cmd.flag("type").value_or("");
    return printResult(controller.upload(file, name, type, declaredSize));
}

int runList(FileStoreController& controller, const CommandLine& cmd) {
    cmd.expectPositionals(0, 0);
    cmd.allowFlags({"filename", "type", "min-size", "max-size", "after", "before",
                    "search", "ordering", "page", "size"});

    ListFilesCommand command;
    command.filename = cmd.flag("filename");
    command.fileType = cmd.flag("type");
    command.search = cmd.flag("search");
    command.minSize = cmd.int64Flag("min-size");
    command.maxSize = cmd.int64Flag("max-size");
    command.uploadedAfter = cmd.flag("after");
    command.uploadedBefore = cmd.flag("before");
    command.ordering = cmd.flag("ordering").value_or(command.ordering);
    command.page = toInt(cmd.int64Flag("page"), command.page, "page");
    command.size = toInt(cmd.int64Flag("size"), command.size, "size");
    return printResult(controller.listFiles(command));
}

int dispatch(FileStoreController& controller, const CommandLine& cmd) {
    if (cmd.command == "upload") {
        return runUpload(controller, cmd);
    }
    if (cmd.command == "delete-file") {
        cmd.expectPositionals(1, 1);
        cmd.allowFlags({});
        return printResult(controller.deleteFile(cmd.positionals[0]));
    }
    if (cmd.command == "delete-reference") {
        cmd.expectPositionals(1, 1);
        cmd.allowFlags({});
        return printResult(controller.deleteReference(cmd.positionals[0]));
    }
    if (cmd.command == "list") {
        return runList(controller, cmd);
    }
    if (cmd.command == "references") {
        cmd.expectPositionals(0, 1);
        cmd.allowFlags({});
        std::optional<std::string> fileId;
        if (!cmd.positionals.empty()) {
            fileId = cmd.positionals[0];
        }
        return printResult(controller.listReferences(fileId));
    }
    if (cmd.command == "stats") {
        cmd.expectPositionals(0, 0);
        cmd.allowFlags({});
        return printResult(controller.statistics());
    }
    if (cmd.command == "backfill") {
        cmd.expectPositionals(0, 0);
        cmd.allowFlags({"batch"});
        return printResult(controller.backfill(toInt(cmd.int64Flag("batch"), 100, "batch")));
    }
    throw UsageError("unknown command: " + cmd.command);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto& config = common::ConfigManager::getInstance();

    CommandLine cmd;
    AppConfig appConfig;
    try {
        cmd = CommandLine::parse(argc, argv);
        if (cmd.command == "help" || cmd.command == "--help") {
            printUsage();
            return EXIT_OK;
        }
        appConfig = AppConfig::fromConfig(config);
    } catch (const UsageError& e) {
        std::cerr << "filehub: " << e.what() << "\n\n";
        printUsage();
        return EXIT_USAGE;
    } catch (const common::ConfigException& e) {
        std::cerr << "filehub: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    common::Logger::initialize("filehub", appConfig.logLevel, !appConfig.logFile.empty(), appConfig.logFile);
    spdlog::debug("Backend: {}, blob storage: {}", appConfig.backend, appConfig.blobStoragePath);

    try {
        std::shared_ptr<filestore::domain::repository::IFileStoreRepository> repository;
        std::shared_ptr<filestore::domain::port::IBlobStoragePort> blobStorage;
        std::shared_ptr<common::DbConnectionPool> pool;

        if (appConfig.backend == "postgres") {
            pool = std::make_shared<common::DbConnectionPool>(
                config.buildConnectionString(), appConfig.poolMin, appConfig.poolMax, appConfig.acquireTimeoutSec);
            if (!pool->initialize()) {
                spdlog::error("Failed to connect to PostgreSQL at {}:{}",
                              config.getString(common::ConfigManager::DB_HOST, "localhost"),
                              config.getInt(common::ConfigManager::DB_PORT, 5432));
                return EXIT_SERVER_ERROR;
            }

            auto executor = std::make_shared<common::PostgreSQLQueryExecutor>(pool.get());
            auto postgres = std::make_shared<filestore::infrastructure::repository::PostgresFileStoreRepository>(
                pool, executor);

            if (cmd.command == "init-schema") {
                cmd.expectPositionals(0, 0);
                cmd.allowFlags({});
                postgres->ensureSchema();
                std::cout << R"({"status": "schema ready"})" << std::endl;
                return EXIT_OK;
            }
            repository = postgres;
            blobStorage = std::make_shared<filestore::infrastructure::adapter::LocalBlobStorageAdapter>(
                appConfig.blobStoragePath);
        } else {
            if (cmd.command == "init-schema") {
                spdlog::info("Memory backend has no schema to create");
                return EXIT_OK;
            }
            // Process-local: state does not survive the invocation
            repository = std::make_shared<filestore::infrastructure::repository::InMemoryFileStoreRepository>();
            blobStorage = std::make_shared<filestore::infrastructure::adapter::InMemoryBlobStorageAdapter>();
        }

        FileStoreController controller(
            repository,
            blobStorage,
            filestore::domain::service::ContentHasher(appConfig.hashChunkSize),
            appConfig.submitMaxAttempts,
            appConfig.debug
        );

        int exitCode = dispatch(controller, cmd);
        common::Logger::flush();
        return exitCode;

    } catch (const UsageError& e) {
        std::cerr << "filehub: " << e.what() << "\n\n";
        printUsage();
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return EXIT_SERVER_ERROR;
    }
}
