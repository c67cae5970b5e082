// colend CLI
// SPDX-License-Identifier: MIT
//
// In-process lending ledger driven from the command line, a script file or an
// interactive prompt. Every command prints a JSON result.

#include <colend/colend.hpp>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace colend;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct CliConfig {
    std::string config_path;
    std::string script_path;
    bool verbose = false;
    bool interactive = true;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Session
//------------------------------------------------------------------------------

struct Session {
    explicit Session(const LedgerConfig& config)
        : ledger(config, clock.source()), caller(config.admin) {}

    LogicalClock clock;
    CLLedger ledger;
    Address caller;
};

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

uint64_t parse_u64(const std::string& s, const char* what) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) {
        throw std::invalid_argument(std::string("invalid ") + what + ": " + s);
    }
    size_t pos = 0;
    uint64_t v = std::stoull(s, &pos);
    if (pos != s.size()) {
        throw std::invalid_argument(std::string("invalid ") + what + ": " + s);
    }
    return v;
}

// "admin", "user<N>" or a 40-digit hex address
Address parse_identity(const Session& session, const std::string& s) {
    if (s == "admin") return session.ledger.config().admin;
    if (s.rfind("user", 0) == 0) {
        uint64_t n = parse_u64(s.substr(4), "user index");
        if (n == 0 || n > 0xFFFF) throw std::invalid_argument("user index out of range: " + s);
        return addresses::from_index(static_cast<uint16_t>(n));
    }
    auto addr = addresses::from_hex(s);
    if (!addr) throw std::invalid_argument("invalid address: " + s);
    return *addr;
}

json status_json(int32_t rc) {
    return json{{"ok", rc == errors::OK}, {"status", errors::to_string(rc)}};
}

json position_json(const CLPosition& p) {
    return json{
        {"id", p.id},
        {"borrower", addresses::to_hex(p.borrower)},
        {"collateral_amount", p.collateral_amount},
        {"debt_amount", p.debt_amount},
        {"interest_rate", p.interest_rate},
        {"opened_at", p.opened_at},
        {"last_accrual_at", p.last_accrual_at},
        {"status", to_string(p.status)},
    };
}

json stats_json(const CLLedger::Stats& s) {
    return json{
        {"total_collateral_locked", s.total_collateral_locked},
        {"total_collateral_deposited", s.total_collateral_deposited},
        {"total_positions_issued", s.total_positions_issued},
        {"active_positions", s.active_positions},
        {"total_repaid", s.total_repaid},
        {"total_liquidations", s.total_liquidations},
        {"total_interest_collected", s.total_interest_collected},
    };
}

void require_args(const std::vector<std::string>& parts, size_t n, const char* usage) {
    if (parts.size() < n) {
        throw std::invalid_argument(std::string("usage: ") + usage);
    }
}

void print_help() {
    std::cout << "Commands:\n"
              << "  init                         Initialize the platform (admin)\n"
              << "  price <asset> <price>        Publish a price (admin)\n"
              << "  min-ratio <percent>          Set minimum collateral ratio (admin)\n"
              << "  liq-threshold <percent>      Set liquidation threshold (admin)\n"
              << "  fee-rate <percent>           Set fee rate (admin)\n"
              << "  as <admin|userN|0x...>       Switch caller identity\n"
              << "  deposit <amount>             Record deposited collateral\n"
              << "  loan <collateral> <debt>     Open a position\n"
              << "  repay <id> <amount>          Settle a position\n"
              << "  check <id>                   Run the liquidation check\n"
              << "  sweep                        Check every active position\n"
              << "  advance <units>              Advance the logical clock\n"
              << "  position <id>                Show a position\n"
              << "  positions [identity]         Active ids for an identity\n"
              << "  owed <id>                    Principal plus interest now\n"
              << "  params                       Risk parameters\n"
              << "  stats                        Protocol aggregates\n"
              << "  help                         Show this help\n"
              << "  quit                         Exit\n";
}

void print_usage(const char* prog) {
    std::cout << "colend CLI - collateral-backed lending ledger\n\n"
              << "Usage: " << prog << " [options] [command] [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Ledger config JSON\n"
              << "  -f, --file <file>    Run commands from file, one per line\n"
              << "  -i, --interactive    Interactive mode (default if no command)\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -h, --help           Show this help message\n\n";
    print_help();
}

//------------------------------------------------------------------------------
// Command Dispatch
//------------------------------------------------------------------------------

json execute(Session& session, const std::vector<std::string>& parts) {
    std::string cmd = parts[0];
    for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    CLLedger& ledger = session.ledger;

    if (cmd == "init") {
        return status_json(ledger.initialize(session.caller));
    } else if (cmd == "price") {
        require_args(parts, 3, "price <asset> <price>");
        return status_json(ledger.set_price(session.caller, parts[1], parse_u64(parts[2], "price")));
    } else if (cmd == "min-ratio") {
        require_args(parts, 2, "min-ratio <percent>");
        return status_json(ledger.set_minimum_ratio(session.caller, parse_u64(parts[1], "ratio")));
    } else if (cmd == "liq-threshold") {
        require_args(parts, 2, "liq-threshold <percent>");
        return status_json(ledger.set_liquidation_threshold(session.caller,
                                                            parse_u64(parts[1], "threshold")));
    } else if (cmd == "fee-rate") {
        require_args(parts, 2, "fee-rate <percent>");
        return status_json(ledger.set_fee_rate(session.caller, parse_u64(parts[1], "fee rate")));
    } else if (cmd == "as") {
        require_args(parts, 2, "as <admin|userN|0x...>");
        session.caller = parse_identity(session, parts[1]);
        return json{{"caller", addresses::to_hex(session.caller)}};
    } else if (cmd == "deposit") {
        require_args(parts, 2, "deposit <amount>");
        return status_json(ledger.deposit_collateral(session.caller, parse_u64(parts[1], "amount")));
    } else if (cmd == "loan") {
        require_args(parts, 3, "loan <collateral> <debt>");
        auto result = ledger.request_loan(session.caller, parse_u64(parts[1], "collateral"),
                                          parse_u64(parts[2], "debt"));
        json out = status_json(result.status);
        if (result.status == errors::OK) out["loan_id"] = result.loan_id;
        return out;
    } else if (cmd == "repay") {
        require_args(parts, 3, "repay <id> <amount>");
        return status_json(ledger.repay(session.caller, parse_u64(parts[1], "loan id"),
                                        parse_u64(parts[2], "amount")));
    } else if (cmd == "check") {
        require_args(parts, 2, "check <id>");
        auto result = ledger.check_liquidation(parse_u64(parts[1], "loan id"));
        json out = status_json(result.status);
        out["liquidated"] = result.liquidated;
        out["ratio"] = u128::to_string(result.ratio);
        return out;
    } else if (cmd == "sweep") {
        std::vector<uint64_t> liquidated;
        json out = status_json(ledger.run_liquidations(liquidated));
        out["liquidated"] = liquidated;
        return out;
    } else if (cmd == "advance") {
        require_args(parts, 2, "advance <units>");
        return json{{"height", session.clock.advance(parse_u64(parts[1], "units"))}};
    } else if (cmd == "position") {
        require_args(parts, 2, "position <id>");
        auto position = ledger.get_position(parse_u64(parts[1], "loan id"));
        if (!position) return status_json(errors::LOAN_NOT_FOUND);
        return position_json(*position);
    } else if (cmd == "positions") {
        Address who = parts.size() > 1 ? parse_identity(session, parts[1]) : session.caller;
        return json{{"user", addresses::to_hex(who)}, {"positions", ledger.get_user_positions(who)}};
    } else if (cmd == "owed") {
        require_args(parts, 2, "owed <id>");
        auto owed = ledger.amount_owed(parse_u64(parts[1], "loan id"));
        if (!owed) return status_json(errors::LOAN_NOT_ACTIVE);
        return json{{"owed", u128::to_string(*owed)}, {"height", ledger.now()}};
    } else if (cmd == "params") {
        RiskParams p = ledger.get_risk_params();
        return json{
            {"minimum_collateral_ratio", p.minimum_collateral_ratio},
            {"liquidation_threshold", p.liquidation_threshold},
            {"fee_rate", p.fee_rate},
            {"initialized", p.initialized},
        };
    } else if (cmd == "stats") {
        json out = stats_json(ledger.get_stats());
        out["aggregates_consistent"] = ledger.audit_aggregates();
        return out;
    }

    throw std::invalid_argument("unknown command: " + cmd + ". Type 'help' for commands.");
}

// Returns false when the command failed to parse
bool run_line(Session& session, const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return true;

    auto parts = split(line);
    if (parts.empty()) return true;
    if (parts[0] == "help") {
        print_help();
        return true;
    }

    try {
        std::cout << execute(session, parts).dump(2) << "\n";
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return false;
    }
    return true;
}

void run_interactive(Session& session) {
    std::cout << "colend CLI - Type 'help' for commands\n> ";

    std::string line;
    while (std::getline(std::cin, line)) {
        std::string cmd = trim(line);
        if (cmd == "quit" || cmd == "exit") {
            std::cout << "Goodbye\n";
            break;
        }
        run_line(session, cmd);
        std::cout << "> ";
    }
}

int run_script(Session& session, const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        std::cerr << "Cannot open script file: " << path << "\n";
        return 1;
    }

    int failures = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (!run_line(session, line)) ++failures;
    }
    return failures == 0 ? 0 : 1;
}

CliConfig parse_args(int argc, char* argv[]) {
    CliConfig config;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config file argument\n";
                std::exit(1);
            }
            config.config_path = argv[++i];
        } else if (arg == "-f" || arg == "--file") {
            if (i + 1 >= argc) {
                std::cerr << "Missing script file argument\n";
                std::exit(1);
            }
            config.script_path = argv[++i];
            config.interactive = false;
        } else if (arg == "-i" || arg == "--interactive") {
            config.interactive = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg[0] != '-') {
            // Command and its arguments
            config.interactive = false;
            while (i < argc) {
                config.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    return config;
}

int main(int argc, char* argv[]) {
    CliConfig cli = parse_args(argc, argv);

    LedgerConfig config;
    try {
        if (!cli.config_path.empty()) {
            config = LedgerConfig::from_file(cli.config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    log::set_level(cli.verbose ? "debug" : config.log_level);

    Session session(config);

    int rc = 0;
    if (!cli.script_path.empty()) {
        rc = run_script(session, cli.script_path);
    }

    if (!cli.command_args.empty()) {
        std::string line;
        for (const auto& arg : cli.command_args) {
            line += arg + " ";
        }
        if (!run_line(session, line)) rc = 1;
    } else if (cli.interactive) {
        run_interactive(session);
    }

    return rc;
}
