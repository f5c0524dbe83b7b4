#include <csignal>
#include <cstdlib>
#include <curl/curl.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include "arp_scanner.hpp"
#include "config.hpp"
#include "file_registry.hpp"
#include "logger.hpp"
#include "notification_dispatcher.hpp"
#include "notification_policy.hpp"
#include "panic_alert.hpp"
#include "presence_engine.hpp"
#include "presence_station.hpp"
#include "status_page.hpp"
#include "version.hpp"
#include "web_server.hpp"

#define DEFAULT_LOG_LIMIT   (20)

namespace {

struct Options {
    std::string config_path;
    std::string network;
    std::string web_host;
    unsigned int interval = 0;
    int web_port = -1;
    bool panic = false;
    bool silent = false;
    bool all = false;
    bool force = false;
    bool has_group = false;
    std::string group;
    unsigned int limit = DEFAULT_LOG_LIMIT;
    std::vector<std::string> args;      /* command and its arguments */
};

PresenceStation *running_station = NULL;

void handle_signal(int)
{
    if (running_station)
        running_station->requestStop();
}

void install_signal_handlers()
{
    struct sigaction sa;
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, NULL);
    sigaction(SIGTERM, &sa, NULL);
}

void print_help(const char *program_name)
{
    std::cout << "Usage: " << program_name << " [options] <command>\n"
              << "Commands:\n"
              << "    init [--force]                    Write a configuration file\n"
              << "    watch [--panic] [--silent]        Monitor the network and notify changes\n"
              << "    serve [--panic] [--silent]        Same as watch with the status web server\n"
              << "    scan                              Scan once and list online devices\n"
              << "    list [--all]                      List online (or all) devices\n"
              << "    add <mac> <name> [--group <g>]    Name a device\n"
              << "    log [mac] [--limit <n>]           Show arrivals and departures\n"
              << "    who                               Tell who is home\n"
              << "    db-path                           Show configuration and state paths\n"
              << "    db-reset [--force]                Forget all devices and events\n"
              << "Options:\n"
              << "    --config, -c <path>               Configuration file\n"
              << "    --network, -n <cidr>              Network to scan, e.g. 192.168.1.0/24\n"
              << "    --interval, -i <seconds>          Time between two scans\n"
              << "    --host, -H <address>              Web server address, 0.0.0.0 for all\n"
              << "    --port <port>                     Web server port\n"
              << "    --version, -v                     Print version\n"
              << "    --help, -h                        Print help\n"
              << std::flush;
}

bool parse_unsigned(const std::string &str, unsigned int &val)
{
    char *end = NULL;
    unsigned long n = strtoul(str.c_str(), &end, 10);
    if (str.empty() || str[0] == '-' || *end != '\0' || n > 0xFFFFFFFFUL)
        return false;

    val = n;
    return true;
}

long file_size(const std::string &path)
{
    struct stat st;
    if (stat(path.c_str(), &st) < 0)
        return -1;
    return st.st_size;
}

void print_online(const std::vector<Device> &devices)
{
    for (auto &d : devices) {
        std::cout << "● " << (d.name.empty() ? "unknown" : d.name)
                  << " (" << d.mac << ")\n";
    }
    std::cout << '\n' << devices.size() << " online" << std::endl;
}

int cmd_monitor(Config &cfg, FileRegistry &registry, const Options &opts, bool serve)
{
    ArpScanner scanner(cfg.network, cfg.vendor_db);
    PresenceEngine engine(registry, scanner, cfg.device_ttl);

    NotificationDispatcher dispatcher;
    PanicAlert panic_alert(std::cout);
    NotificationPolicy policy(cfg.notify, cfg.panic, dispatcher, panic_alert);
    for (auto &channel : create_channels(cfg.notify))
        policy.addChannel(channel);

    PresenceStation station(engine, &policy, cfg.interval);
    station.addObserver([] (const PresenceChange &change) {
        std::cout << format_change(change, time(NULL)) << std::endl;
    });

    std::cout << "Watching " << cfg.network << '\n';
    if (opts.panic)
        std::cout << "PANIC MODE\n";
    if (opts.silent)
        std::cout << "Silent\n";
    std::cout << "Scan interval: " << cfg.interval << "s\n" << std::endl;

    StatusPage page(registry, engine);
    WebServer web_server(page, cfg.web_host, cfg.web_port);
    if (serve) {
        web_server.start();
        std::string host = cfg.web_host == DEFAULT_WEB_HOST ? "localhost" : cfg.web_host;
        std::cout << "Web UI: http://" << host << ':' << cfg.web_port << '\n' << std::endl;
    }

    dispatcher.start();

    running_station = &station;
    install_signal_handlers();
    station.run(!opts.silent);
    running_station = NULL;

    dispatcher.stop();
    if (serve)
        web_server.stop();

    std::cout << "\nStopped" << std::endl;
    return 0;
}

bool ask_yes_no(const std::string &question)
{
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    std::getline(std::cin, answer);
    return answer == "y" || answer == "Y" || answer == "yes";
}

std::string ask(const std::string &question, const std::string &default_answer)
{
    std::cout << question;
    if (!default_answer.empty())
        std::cout << " [" << default_answer << ']';
    std::cout << ": " << std::flush;

    std::string answer;
    std::getline(std::cin, answer);
    return answer.empty() ? default_answer : answer;
}

int cmd_init(const Options &opts)
{
    std::string path = opts.config_path.empty() ? default_config_path() : opts.config_path;

    if (!opts.force && file_size(path) >= 0
    &&  !ask_yes_no("Configuration " + path + " exists. Overwrite?")) {
        std::cout << "Aborted" << std::endl;
        return 1;
    }

    Config cfg = default_config();
    if (!opts.network.empty())
        cfg.network = opts.network;
    else
        cfg.network = detect_local_network();
    std::cout << "Detected network: " << cfg.network << '\n';

    while (true) {
        std::string network = ask("Network to scan", cfg.network);
        NetworkRange range;
        if (parse_network_range(network, range)) {
            cfg.network = network;
            break;
        }
        std::cout << "Invalid network range \"" << network << "\"\n";
        if (!std::cin) {
            std::cout << "Aborted" << std::endl;
            return 1;
        }
    }

    if (opts.interval)
        cfg.interval = opts.interval;
    if (!opts.web_host.empty())
        cfg.web_host = opts.web_host;
    if (opts.web_port >= 0)
        cfg.web_port = opts.web_port;

    cfg.panic.enabled = ask_yes_no("Enable panic mode?");
    if (cfg.panic.enabled)
        cfg.panic.message = ask("Panic message", cfg.panic.message);

    try {
        validate_config(cfg);
    } catch (const ConfigError &e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    if (!save_config(path, cfg)) {
        std::cerr << "Could not write " << path << std::endl;
        return 1;
    }

    std::cout << "✓ Saved to " << path << std::endl;
    return 0;
}

int cmd_scan(Config &cfg, FileRegistry &registry)
{
    ArpScanner scanner(cfg.network, cfg.vendor_db);
    PresenceEngine engine(registry, scanner, cfg.device_ttl);
    PresenceStation station(engine, NULL, cfg.interval);

    if (!station.runOnce(false)) {
        std::cerr << "Scan of " << cfg.network << " failed" << std::endl;
        return 1;
    }

    std::vector<Device> online = registry.listOnline();
    if (online.empty()) {
        std::cout << "No devices found" << std::endl;
        return 0;
    }

    print_online(online);
    return 0;
}

int cmd_list(FileRegistry &registry, const Options &opts)
{
    std::vector<Device> devices = opts.all ? registry.listAll() : registry.listOnline();
    if (devices.empty()) {
        std::cout << "No devices" << std::endl;
        return 0;
    }

    for (auto &d : devices) {
        std::cout << (d.is_online ? "● " : "○ ")
                  << std::left << std::setw(24) << (d.name.empty() ? "unknown" : d.name) << ' '
                  << std::setw(12) << d.group << ' '
                  << d.mac << '\n';
    }
    std::cout << '\n' << devices.size() << " devices" << std::endl;
    return 0;
}

int cmd_add(FileRegistry &registry, const Options &opts)
{
    if (opts.args.size() != 3) {
        std::cerr << "Usage: add <mac> <name> [--group <group>]" << std::endl;
        return -1;
    }

    std::string mac;
    if (!normalize_mac(opts.args[1], mac)) {
        std::cerr << "Invalid MAC address \"" << opts.args[1] << '\"' << std::endl;
        return 1;
    }

    Device d;
    if (!registry.get(mac, d)) {
        std::cerr << "Unknown device " << mac << ", it must be seen by a scan first" << std::endl;
        return 1;
    }

    const std::string &name = opts.args[2];
    if (!registry.setName(mac, name)
    ||  (opts.has_group && !registry.setGroup(mac, opts.group))) {
        std::cerr << "Could not store device " << mac << std::endl;
        return 1;
    }

    std::cout << "✓ " << name;
    if (opts.has_group)
        std::cout << " (" << opts.group << ')';
    std::cout << std::endl;
    return 0;
}

int cmd_log(FileRegistry &registry, const Options &opts)
{
    std::string mac;
    if (opts.args.size() > 2) {
        std::cerr << "Usage: log [mac] [--limit <n>]" << std::endl;
        return -1;
    }
    if (opts.args.size() == 2 && !normalize_mac(opts.args[1], mac)) {
        std::cerr << "Invalid MAC address \"" << opts.args[1] << '\"' << std::endl;
        return 1;
    }

    std::vector<PresenceEvent> events = registry.listEvents(mac, 0, opts.limit);
    if (events.empty()) {
        std::cout << "No history" << std::endl;
        return 0;
    }

    for (auto &e : events) {
        Device d;
        std::string name = registry.get(e.mac, d) ? device_display_name(d) : e.mac;
        std::cout << format_timestamp(e.timestamp, "%F %H:%M") << ' '
                  << (e.kind == EVENT_ARRIVED ? "● " : "○ ") << name << '\n';
    }
    std::cout << std::flush;
    return 0;
}

int cmd_who(Config &cfg, FileRegistry &registry)
{
    /* Never scans, only reports the stored state */
    ArpScanner scanner(cfg.network, cfg.vendor_db);
    PresenceEngine engine(registry, scanner, cfg.device_ttl);
    std::cout << engine.summary() << std::endl;
    return 0;
}

int cmd_db_path(const Config &cfg, const Options &opts)
{
    FileRegistry registry(cfg.state_dir);

    std::cout << "Config:   " << (opts.config_path.empty() ? default_config_path() : opts.config_path) << '\n';
    std::cout << "State:    " << cfg.state_dir << '\n';

    const std::string paths[] = { registry.getDevicesPath(), registry.getEventsPath() };
    for (auto &path : paths) {
        long size = file_size(path);
        std::cout << "          " << path;
        if (size >= 0)
            std::cout << " (" << size << " bytes)";
        std::cout << '\n';
    }
    std::cout << std::flush;
    return 0;
}

int cmd_db_reset(FileRegistry &registry, const Options &opts)
{
    if (!opts.force && !ask_yes_no("Delete all data?")) {
        std::cout << "Aborted" << std::endl;
        return 1;
    }

    if (!registry.reset()) {
        std::cerr << "Could not reset device registry" << std::endl;
        return 1;
    }

    std::cout << "✓ Reset" << std::endl;
    return 0;
}

}

int main(int argc, char **argv)
{
    char *program_name = argv[0];
    Options opts;

    argc--;
    argv++;
    while (argc) {
        std::string opt(argv[0]);
        if ((opt == "--config" || opt == "-c") && argc >= 2) {
            opts.config_path = argv[1];
            argc--;
            argv++;
        } else if ((opt == "--network" || opt == "-n") && argc >= 2) {
            opts.network = argv[1];
            argc--;
            argv++;
        } else if ((opt == "--interval" || opt == "-i") && argc >= 2) {
            if (!parse_unsigned(argv[1], opts.interval) || opts.interval == 0) {
                std::cerr << "Invalid interval \"" << argv[1] << '\"' << std::endl;
                return -1;
            }
            argc--;
            argv++;
        } else if ((opt == "--host" || opt == "-H") && argc >= 2) {
            opts.web_host = argv[1];
            argc--;
            argv++;
        } else if (opt == "--port" && argc >= 2) {
            unsigned int port;
            if (!parse_unsigned(argv[1], port) || port > 65535) {
                std::cerr << "Invalid port \"" << argv[1] << '\"' << std::endl;
                return -1;
            }
            opts.web_port = port;
            argc--;
            argv++;
        } else if ((opt == "--group" || opt == "-g") && argc >= 2) {
            opts.has_group = true;
            opts.group = argv[1];
            argc--;
            argv++;
        } else if (opt == "--limit" && argc >= 2) {
            if (!parse_unsigned(argv[1], opts.limit)) {
                std::cerr << "Invalid limit \"" << argv[1] << '\"' << std::endl;
                return -1;
            }
            argc--;
            argv++;
        } else if (opt == "--panic") {
            opts.panic = true;
        } else if (opt == "--silent" || opt == "-s") {
            opts.silent = true;
        } else if (opt == "--all" || opt == "-a") {
            opts.all = true;
        } else if (opt == "--force" || opt == "-f") {
            opts.force = true;
        } else if (opt == "--help" || opt == "-h") {
            print_help(program_name);
            return 0;
        } else if (opt == "--version" || opt == "-v") {
            std::cout << get_version_str() << std::endl;
            return 0;
        } else if (!opt.empty() && opt[0] == '-') {
            std::cerr << "Invalid option: \"" << opt << '\"' << std::endl;
            print_help(program_name);
            return -1;
        } else {
            opts.args.push_back(opt);
        }

        argc--;
        argv++;
    }

    if (opts.args.empty()) {
        print_help(program_name);
        return -1;
    }

    const std::string &command = opts.args[0];
    bool daemon = command == "watch" || command == "serve";

    if (command == "init") {
        Logger::instance().setLevel(LOG_WARN);
        return cmd_init(opts);
    }

    Config cfg;
    try {
        cfg = load_config(opts.config_path.empty() ? default_config_path() : opts.config_path);
        if (!opts.network.empty())
            cfg.network = opts.network;
        if (opts.interval)
            cfg.interval = opts.interval;
        if (!opts.web_host.empty())
            cfg.web_host = opts.web_host;
        if (opts.web_port >= 0)
            cfg.web_port = opts.web_port;
        if (opts.panic) {
            cfg.panic.enabled = true;
            cfg.panic.only_unknown = false;
        }
        validate_config(cfg);
    } catch (const ConfigError &e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    /* Only problems are shown by the one-shot commands */
    Logger::instance().setLevel(daemon || cfg.log_level > LOG_WARN ? cfg.log_level : LOG_WARN);
    if (daemon) {
        Logger::instance().startLogging(cfg.log_dir);
        std::stringstream ss;
        ss << program_name << " (version: " << get_version_str() << ") started";
        Logger::info(ss.str());
    }

    if (command == "db-path")
        return cmd_db_path(cfg, opts);

    FileRegistry registry(cfg.state_dir);
    try {
        registry.open();
    } catch (const RegistryError &e) {
        std::cerr << "Cannot open device registry: " << e.what() << std::endl;
        Logger::err(e.what());
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int ret;
    try {
        if (command == "watch" || command == "serve")
            ret = cmd_monitor(cfg, registry, opts, command == "serve");
        else if (command == "scan")
            ret = cmd_scan(cfg, registry);
        else if (command == "list")
            ret = cmd_list(registry, opts);
        else if (command == "add")
            ret = cmd_add(registry, opts);
        else if (command == "log")
            ret = cmd_log(registry, opts);
        else if (command == "who")
            ret = cmd_who(cfg, registry);
        else if (command == "db-reset")
            ret = cmd_db_reset(registry, opts);
        else {
            std::cerr << "Unknown command \"" << command << '\"' << std::endl;
            print_help(program_name);
            ret = -1;
        }
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        Logger::err(e.what());
        ret = 1;
    }

    curl_global_cleanup();
    Logger::instance().stopLogging();

    return ret;
}
