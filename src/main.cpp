#include "bulkget/batch_orchestrator.hpp"
#include "bulkget/config.hpp"
#include "bulkget/console_progress.hpp"
#include "bulkget/curl_http_client.hpp"
#include "bulkget/error.hpp"
#include "bulkget/history.hpp"
#include "bulkget/libssh2_sftp_session.hpp"
#include "bulkget/log.hpp"
#include "bulkget/sftp_connection_cache.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <pthread.h>

namespace {

constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

struct CommandLine {
    std::filesystem::path destination{"."};
    std::optional<std::size_t> concurrency;
    bool no_resume{false};
    bool to_stdout{false};
    bool quiet{false};
    bool verbose{false};
    std::optional<std::string> config_path;
    std::optional<std::string> identity;
    std::optional<std::string> password;
    std::optional<std::string> passphrase;
    std::optional<bulkget::KnownHostsPolicy> known_hosts_policy;
    std::optional<std::string> history_path;
    std::vector<std::string> urls;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url> [<url> ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d, --destination <dir>     Download directory (default: current directory)\n"
              << "  -c, --concurrency <n>       Maximum simultaneous transfers (default: 3)\n"
              << "      --no-resume             Always start from scratch\n"
              << "  -o -                        Write the single download to standard output\n"
              << "  -q, --quiet                 No progress display\n"
              << "      --config <file>         JSON configuration file\n"
              << "  -i, --identity <keyfile>    SSH private key for sftp:// URLs\n"
              << "      --password <password>   SSH password for sftp:// URLs\n"
              << "      --passphrase <text>     Passphrase of the SSH private key\n"
              << "      --known-hosts-policy <strict|accept-new|off>\n"
              << "      --history <file>        Append one JSON line per transfer to <file>\n"
              << "  -v, --verbose               Debug logging\n"
              << "  -h, --help                  Show this message" << std::endl;
}

CommandLine parseArguments(int argc, char** argv) {
    CommandLine cli;
    int arg_index = 1;

    const auto value = [&](const std::string& option) -> std::string {
        if (arg_index + 1 >= argc) {
            throw UsageError("Missing value for " + option);
        }
        arg_index += 2;
        return argv[arg_index - 1];
    };

    while (arg_index < argc) {
        const std::string option = argv[arg_index];
        if (option.empty() || option[0] != '-' || option == "-") {
            cli.urls.push_back(option);
            ++arg_index;
        } else if (option == "--") {
            for (++arg_index; arg_index < argc; ++arg_index) {
                cli.urls.emplace_back(argv[arg_index]);
            }
        } else if (option == "-d" || option == "--destination") {
            cli.destination = value(option);
        } else if (option == "-c" || option == "--concurrency") {
            const std::string text = value(option);
            try {
                const int n = std::stoi(text);
                if (n < 1) {
                    throw UsageError("Concurrency must be at least 1");
                }
                cli.concurrency = static_cast<std::size_t>(n);
            } catch (const std::logic_error&) {
                throw UsageError("Invalid concurrency: " + text);
            }
        } else if (option == "--no-resume") {
            cli.no_resume = true;
            ++arg_index;
        } else if (option == "-o") {
            if (value(option) != "-") {
                throw UsageError("Only '-o -' (standard output) is supported");
            }
            cli.to_stdout = true;
        } else if (option == "-q" || option == "--quiet") {
            cli.quiet = true;
            ++arg_index;
        } else if (option == "-v" || option == "--verbose") {
            cli.verbose = true;
            ++arg_index;
        } else if (option == "--config") {
            cli.config_path = value(option);
        } else if (option == "-i" || option == "--identity") {
            cli.identity = value(option);
        } else if (option == "--password") {
            cli.password = value(option);
        } else if (option == "--passphrase") {
            cli.passphrase = value(option);
        } else if (option == "--known-hosts-policy") {
            const std::string text = value(option);
            cli.known_hosts_policy = bulkget::ConfigLoader::parseKnownHostsPolicy(text);
            if (!cli.known_hosts_policy) {
                throw UsageError("Unknown known-hosts policy: " + text);
            }
        } else if (option == "--history") {
            cli.history_path = value(option);
        } else if (option == "-h" || option == "--help") {
            throw UsageError("");
        } else {
            throw UsageError("Unknown option: " + option);
        }
    }

    if (cli.urls.empty()) {
        throw UsageError("No URLs given");
    }
    return cli;
}

bulkget::AppConfig loadConfig(const CommandLine& cli) {
    const auto env = bulkget::ConfigLoader::processEnvironment();

    bulkget::AppConfig config;
    std::optional<std::string> path = cli.config_path;
    if (!path) {
        path = env("BULKGET_CONFIG");
    }
    if (path) {
        config = bulkget::ConfigLoader::parseJsonFile(*path);
    }
    bulkget::ConfigLoader::applyEnvironment(config, env);

    auto& options = config.options;
    if (cli.concurrency) {
        options.max_concurrent = *cli.concurrency;
    }
    if (cli.no_resume) {
        options.enable_resume = false;
    }
    options.output_to_stdout = cli.to_stdout;
    options.quiet_mode = cli.quiet || cli.to_stdout;

    auto& ssh = options.protocol.ssh;
    if (cli.identity) {
        ssh.private_key_path = *cli.identity;
    }
    if (cli.password) {
        ssh.password = *cli.password;
    }
    if (cli.passphrase) {
        ssh.passphrase = *cli.passphrase;
    }
    if (cli.known_hosts_policy) {
        ssh.known_hosts_policy = *cli.known_hosts_policy;
    }

    if (cli.verbose) {
        config.log_level = "debug";
    } else if (options.quiet_mode && config.log_level == "info") {
        config.log_level = "warn";
    }
    return config;
}

// SIGINT/SIGTERM are blocked in every thread while this is alive; its thread waits
// for them. SIGUSR1 from the destructor stops it before the cache goes away.
class SignalWatcher {
public:
    explicit SignalWatcher(bulkget::SftpConnectionCache& cache) : cache_(cache) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, kStopSignal);
        pthread_sigmask(SIG_BLOCK, &signals_, &previous_);
        thread_ = std::thread([this]() { watch(); });
    }

    ~SignalWatcher() {
        stopping_ = true;
        pthread_kill(thread_.native_handle(), kStopSignal);
        thread_.join();
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    static constexpr int kStopSignal = SIGUSR1;

    void watch() {
        int received = 0;
        for (;;) {
            if (sigwait(&signals_, &received) != 0) {
                return;
            }
            if (received != kStopSignal) {
                break;
            }
            if (stopping_) {
                return;
            }
        }
        bulkget::logger()->warn("Interrupted (signal {}), closing connections", received);
        try {
            cache_.closeAll();
        } catch (const std::exception& ex) {
            bulkget::logger()->warn("Error while closing connections: {}", ex.what());
        }
        std::_Exit(kExitInterrupted);
    }

    bulkget::SftpConnectionCache& cache_;
    sigset_t signals_;
    sigset_t previous_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

} // namespace

int main(int argc, char** argv) {
    CommandLine cli;
    try {
        cli = parseArguments(argc, argv);
    } catch (const UsageError& ex) {
        const std::string message = ex.what();
        if (!message.empty()) {
            std::cerr << message << std::endl;
        }
        printUsage(argv[0]);
        return message.empty() ? 0 : kExitUsage;
    }

    try {
        const bulkget::AppConfig config = loadConfig(cli);
        if (!bulkget::setLogLevel(config.log_level)) {
            std::cerr << "Unknown log level: " << config.log_level << std::endl;
            return kExitUsage;
        }

        bulkget::CurlHttpClient http;
        bulkget::SftpConnectionCache cache(
            [] { return std::make_unique<bulkget::Libssh2SftpSession>(); });
        const SignalWatcher watcher(cache);

        bulkget::ConsoleProgress console(std::cout);
        std::unique_ptr<bulkget::JsonlHistoryLog> history;
        if (cli.history_path) {
            history = std::make_unique<bulkget::JsonlHistoryLog>(*cli.history_path);
        }

        bulkget::BatchOrchestrator orchestrator(http, cache, console, history.get());
        const auto results = orchestrator.run(cli.urls, cli.destination, config.options);
        orchestrator.closeConnections();

        if (!config.options.quiet_mode) {
            console.printSummary(orchestrator.statistics());
        }

        for (const auto& result : results) {
            if (!result.success) {
                return kExitFailed;
            }
        }
        return 0;
    } catch (const bulkget::TransferError& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        const auto kind = ex.kind();
        return kind == bulkget::ErrorKind::Validation || kind == bulkget::ErrorKind::Configuration ? kExitUsage
                                                                                                 : kExitFailed;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return kExitFailed;
    }
}
