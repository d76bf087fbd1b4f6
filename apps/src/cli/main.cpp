#include "core/AsyncOperation.h"
#include "core/ClientConfig.h"
#include "core/Clock.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/TaskExecutor.h"
#include "core/network/CurlHttpTransport.h"
#include "discovery/HealthProbe.h"
#include "discovery/ServerResolver.h"
#include "pairing/PairingCoordinator.h"
#include "session/FileCredentialStore.h"
#include "session/SessionManager.h"
#include <args.hxx>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <termios.h>
#include <thread>
#include <unistd.h>

using namespace ArcticLink;

namespace {

std::atomic<bool> interrupted{ false };

void handleSignal(int /*signum*/)
{
    interrupted.store(true);
}

struct CurlGlobal {
    CurlGlobal() : ok(Network::CurlHttpTransport::globalInit()) {}
    ~CurlGlobal()
    {
        if (ok) {
            Network::CurlHttpTransport::globalCleanup();
        }
    }

    bool ok;
};

std::string getCommandListHelp()
{
    return "Command: resolve <address> | login <identifier> | logout | status | pair | "
           "activate <code> | reset";
}

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  arcticlink-cli resolve 192.168.1.50:8085\n"
           "  arcticlink-cli login alice\n"
           "  arcticlink-cli pair\n"
           "  arcticlink-cli activate ABCD-1234\n"
           "  arcticlink-cli -C network:trace status\n";
}

// Waits on op, cancelling it once on Ctrl-C.
template <typename T>
T waitInterruptible(AsyncOperation<T>& op)
{
    bool cancelled = false;
    while (!op.isReady()) {
        if (interrupted.load() && !cancelled) {
            op.cancel();
            cancelled = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return op.get();
}

std::string readPassword()
{
    std::cerr << "Password: " << std::flush;

    termios oldTerm{};
    const bool isTty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &oldTerm) == 0;
    if (isTty) {
        termios noEcho = oldTerm;
        noEcho.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        if (::tcsetattr(STDIN_FILENO, TCSANOW, &noEcho) != 0) {
            SLOG_WARN("Could not disable terminal echo");
        }
    }

    std::string password;
    std::getline(std::cin, password);

    if (isTty && ::tcsetattr(STDIN_FILENO, TCSANOW, &oldTerm) != 0) {
        SLOG_WARN("Could not restore terminal settings");
    }
    std::cerr << std::endl;
    return password;
}

void printError(const Session::AuthError& error)
{
    std::cerr << "Error (" << Session::toString(error.kind) << "): " << error.message;
    if (error.httpStatus != 0) {
        std::cerr << " [HTTP " << error.httpStatus << "]";
    }
    std::cerr << std::endl;
}

int runResolve(
    const std::string& address,
    const Discovery::ServerResolver& resolver,
    Session::SessionManager& session,
    TaskExecutor& executor)
{
    auto op = resolver.resolveAsync(executor, address);
    auto result = waitInterruptible(op);
    if (result.isError()) {
        const auto& error = result.errorValue();
        if (error.cancelled) {
            std::cerr << "Cancelled." << std::endl;
            return 130;
        }
        std::cerr << "Could not reach a server at '" << address << "': " << error.lastCause
                  << std::endl;
        for (const auto& url : error.attemptedUrls) {
            std::cerr << "  tried " << url << std::endl;
        }
        return 1;
    }

    auto stored = session.setServerConfig(result.value());
    if (stored.isError()) {
        printError(stored.errorValue());
        return 1;
    }
    std::cout << "Connected to " << result.value().baseUrl << std::endl;
    return 0;
}

int runLogin(
    const std::string& identifier,
    std::string password,
    Session::SessionManager& session,
    TaskExecutor& executor)
{
    if (password.empty()) {
        password = readPassword();
    }

    auto op = runAsync(executor, [&](const CancellationToken& token) {
        return session.login(identifier, password, token);
    });
    auto result = waitInterruptible(op);
    if (result.isError()) {
        printError(result.errorValue());
        return result.errorValue().kind == Session::AuthError::Kind::Cancelled ? 130 : 1;
    }
    std::cout << "Logged in as " << result.value().username << " (" << result.value().role << ")"
              << std::endl;
    return 0;
}

int runStatus(Session::SessionManager& session)
{
    const auto state = session.checkAuth();
    std::cout << "State:  " << Session::toString(state) << std::endl;
    if (const auto server = session.getServerConfig()) {
        std::cout << "Server: " << server->baseUrl << std::endl;
    }
    if (const auto user = session.getUserProfile()) {
        std::cout << "User:   " << user->username << " <" << user->email << "> id=" << user->id
                  << std::endl;
    }
    return 0;
}

int runPair(
    Network::HttpTransport& transport,
    Session::SessionManager& session,
    const ClientConfig& config)
{
    const auto server = session.getServerConfig();
    if (!server) {
        std::cerr << "No server configured. Run 'resolve <address>' first." << std::endl;
        return 1;
    }

    ThreadTaskExecutor executor;
    SteadyClock clock;
    Pairing::PairingCoordinator coordinator(
        transport,
        session,
        executor,
        clock,
        Pairing::PairingCoordinator::Options{
            .requestRetries = config.pairing_request_retries,
            .defaultIntervalSeconds = config.pairing_default_interval_s,
            .requestTimeout = config.requestTimeout(),
            .clientName = config.client_name,
        });

    coordinator.onStateChanged([&coordinator](const std::string& state) {
        if (state == "Polling") {
            const auto display = coordinator.getDisplay();
            std::cout << "Visit " << display.verificationUrl << " and enter code "
                      << display.userCode << std::endl;
        }
    });
    coordinator.onCountdown([](int remaining) {
        std::cout << "\r  " << remaining << "s remaining   " << std::flush;
    });

    auto started = coordinator.start(server.value());
    if (started.isError()) {
        printError(started.errorValue());
        return 1;
    }

    while (!coordinator.isTerminal()) {
        if (interrupted.load()) {
            coordinator.cancel();
            std::cout << std::endl << "Cancelled." << std::endl;
            return 130;
        }
        coordinator.update();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cout << std::endl;

    if (const auto failure = coordinator.getFailure()) {
        printError(failure.value());
        return 1;
    }
    if (coordinator.getCurrentStateName() == "Expired") {
        std::cerr << "The code expired before it was entered." << std::endl;
        return 1;
    }
    std::cout << "Paired with " << server->baseUrl << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "ArcticLink CLI", "Connect to and authenticate with a media server.\n\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for arcticlink.json", { "config-dir" });
    args::ValueFlag<std::string> storePath(
        parser, "path", "Session file (default: from config)", { "store" });
    args::ValueFlag<std::string> channels(
        parser,
        "spec",
        "Per-channel log levels, e.g. 'network:trace,pairing:debug' or '*:off'",
        { 'C', "channels" });
    args::ValueFlag<std::string> logConfig(
        parser, "path", "Logging config file (JSON)", { "log-config" });
    args::ValueFlag<std::string> password(
        parser, "password", "Login password (prompted when omitted)", { 'p', "password" });

    args::Positional<std::string> command(parser, "command", getCommandListHelp());
    args::Positional<std::string> argument(
        parser, "argument", "Address, identifier or code, depending on command");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (logConfig) {
        LoggingChannels::initializeFromConfig(args::get(logConfig), "cli");
    }
    else {
        LoggingChannels::initialize(
            verbose ? spdlog::level::debug : spdlog::level::warn,
            spdlog::level::debug,
            "cli",
            true);
    }
    if (channels) {
        LoggingChannels::configureFromString(args::get(channels));
    }

    if (!command) {
        std::cerr << "Error: command is required\n\n" << parser;
        return 1;
    }
    const std::string commandName = args::get(command);
    const std::string commandArg = argument ? args::get(argument) : "";

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }
    auto configResult = ConfigLoader::loadOrDefault<ClientConfig>(ClientConfig::fileName());
    if (configResult.isError()) {
        std::cerr << "Error: " << configResult.errorValue() << std::endl;
        return 1;
    }
    const ClientConfig config = configResult.value();

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    CurlGlobal curl;
    if (!curl.ok) {
        std::cerr << "Error: HTTP stack failed to initialize" << std::endl;
        return 1;
    }

    Network::CurlHttpTransport transport(Network::CurlHttpTransport::Options{
        .connectTimeout = std::chrono::milliseconds(config.connect_timeout_ms),
        .verifyTls = config.verify_tls,
        .userAgent = config.userAgent(),
        .defaultHeaders = { { "X-Client-Name", config.client_name } },
    });

    Session::FileCredentialStore store(
        storePath ? std::filesystem::path(args::get(storePath)) : config.credentialStorePath());
    Session::SessionManager session(
        transport,
        store,
        Session::SessionManager::Options{
            .requestTimeout = config.requestTimeout(),
            .clientName = config.client_name,
        });
    session.loadPersisted();

    ThreadTaskExecutor executor;

    if (commandName == "resolve") {
        if (commandArg.empty()) {
            std::cerr << "Usage: arcticlink-cli resolve <address>" << std::endl;
            return 1;
        }
        Discovery::HealthProbe probe(
            transport,
            Discovery::HealthProbe::Options{
                .timeout = config.probeTimeout(),
                .clientName = config.client_name,
            });
        Discovery::ServerResolver resolver(probe);
        return runResolve(commandArg, resolver, session, executor);
    }
    if (commandName == "login") {
        if (commandArg.empty()) {
            std::cerr << "Usage: arcticlink-cli login <identifier>" << std::endl;
            return 1;
        }
        return runLogin(commandArg, password ? args::get(password) : "", session, executor);
    }
    if (commandName == "logout") {
        session.logout();
        std::cout << "Logged out." << std::endl;
        return 0;
    }
    if (commandName == "status") {
        return runStatus(session);
    }
    if (commandName == "pair") {
        return runPair(transport, session, config);
    }
    if (commandName == "activate") {
        if (commandArg.empty()) {
            std::cerr << "Usage: arcticlink-cli activate <code>" << std::endl;
            return 1;
        }
        auto result = session.activatePairingCode(commandArg);
        if (result.isError()) {
            printError(result.errorValue());
            return 1;
        }
        std::cout << "Device authorized." << std::endl;
        return 0;
    }
    if (commandName == "reset") {
        session.clearServerConfig();
        std::cout << "Server configuration cleared." << std::endl;
        return 0;
    }

    std::cerr << "Error: unknown command '" << commandName << "'\n\n" << parser;
    return 1;
}
