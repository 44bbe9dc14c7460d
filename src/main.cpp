/**
 * @file main.cpp
 * @brief Runs the default participant roster and prints the resulting market
 *
 * Exit status is 2 for a bad command line and 1 for a failure while running.
 */

#include <lobsim/common/types.hpp>
#include <lobsim/common/time.hpp>
#include <lobsim/engine/matching_engine.hpp>
#include <lobsim/logging/async_logger.hpp>
#include <lobsim/sim/simulation.hpp>

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lobsim;

namespace {

struct CliOptions {
    std::uint64_t ticks{100};
    std::uint64_t seed{12345};
    std::size_t depth{5};
    std::size_t trades{10};
    std::string log_file;
    bool verbose{false};
};

void print_usage(const char* program, std::ostream& out) {
    const CliOptions defaults;
    out << "Usage: " << program << " [--ticks N] [--seed S] [--depth D] [--trades K] [--log FILE] [--verbose]\n\n"
        << "  --ticks N     simulation steps (" << defaults.ticks << ")\n"
        << "  --seed S      RNG seed for every participant (" << defaults.seed << ")\n"
        << "  --depth D     price levels printed per side (" << defaults.depth << ")\n"
        << "  --trades K    most recent trades printed (" << defaults.trades << ")\n"
        << "  --log FILE    write the engine log to FILE\n"
        << "  --verbose     log at Debug level, one line per fill\n"
        << "  --help        this text\n";
}

/// @throws std::invalid_argument on an unknown flag or a flag missing its value
CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " needs a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "--ticks") {
            options.ticks = std::stoull(value_of(i, flag));
        } else if (flag == "--seed") {
            options.seed = std::stoull(value_of(i, flag));
        } else if (flag == "--depth") {
            options.depth = std::stoull(value_of(i, flag));
        } else if (flag == "--trades") {
            options.trades = std::stoull(value_of(i, flag));
        } else if (flag == "--log") {
            options.log_file = value_of(i, flag);
        } else if (flag == "--verbose") {
            options.verbose = true;
        } else if (flag == "--help") {
            print_usage(argv[0], std::cout);
            std::exit(0);
        } else {
            throw std::invalid_argument("unknown option " + flag);
        }
    }

    return options;
}

void print_book(const BookSnapshot& book) {
    std::cout << "\n--- Book ---\n";
    std::cout << std::setw(12) << "BID QTY" << std::setw(12) << "PRICE"
              << std::setw(12) << "ASK QTY" << "\n";

    // Asks from the top of the ladder down to the touch
    for (auto it = book.asks.rbegin(); it != book.asks.rend(); ++it) {
        std::cout << std::setw(12) << "" << std::setw(12) << it->price.get()
                  << std::setw(12) << it->qty.get() << "\n";
    }
    std::cout << "  " << std::string(34, '-') << "\n";
    for (const auto& level : book.bids) {
        std::cout << std::setw(12) << level.qty.get() << std::setw(12) << level.price.get() << "\n";
    }
}

void print_trades(const std::vector<Trade>& trades, const MatchingEngine& engine) {
    std::cout << "\n--- Last " << trades.size() << " trades ---\n";
    for (const auto& trade : trades) {
        std::cout << "  " << std::setw(6) << trade.qty.get() << " @ " << std::setw(8) << trade.price.get()
                  << "  buyer=" << engine.participant_name(trade.buyer)
                  << " seller=" << engine.participant_name(trade.seller)
                  << " aggressor=" << to_string(trade.aggressor_side) << "\n";
    }
}

void print_accounts(const MatchingEngine& engine) {
    std::cout << "\n--- Accounts ---\n";
    double mark = engine.get_mid_price();
    for (const auto& account : engine.accounts()) {
        std::cout << "  " << std::left << std::setw(18) << engine.participant_name(account.participant)
                  << std::right
                  << " position=" << std::setw(6) << account.position
                  << " cash=" << std::setw(12) << account.cash
                  << " mtm=" << std::setw(10) << account.mark_to_market(mark)
                  << " fills=" << account.fill_count << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        print_usage(argv[0], std::cerr);
        return 2;
    }

    try {
        std::unique_ptr<AsyncLogger> logger;
        if (!options.log_file.empty()) {
            logger = std::make_unique<AsyncLogger>(options.log_file,
                                                   options.verbose ? LogLevel::Debug : LogLevel::Info);
        }

        sim::SimulationConfig sim_config;
        sim_config.seed = options.seed;
        sim_config.engine.log_fills = options.verbose;

        sim::Simulation simulation(sim_config, logger.get());
        simulation.add_default_roster();

        std::cout << "lobsim: " << options.ticks << " ticks, seed " << options.seed << "\n";
        const Timestamp started = now_ns();
        simulation.run(options.ticks);
        const Duration wall = elapsed_ns(started);

        const MatchingEngine& engine = simulation.engine();

        std::cout << std::fixed << std::setprecision(2);
        print_book(engine.get_book(options.depth));
        print_trades(engine.recent_trades(options.trades), engine);
        print_accounts(engine);

        std::cout << "\n--- Market ---\n"
                  << "  mid            " << engine.get_mid_price() << "\n";
        if (const auto spread = engine.spread()) {
            std::cout << "  spread         " << *spread << "\n";
        }
        std::cout << "  resting orders " << engine.order_count() << "\n"
                  << "  simulated      " << simulation.now() << " s\n"
                  << "  wall           " << ns_to_ms(wall) << " ms\n";

        engine.stats().print_summary();

        if (logger) {
            logger->flush();
            std::cout << "\n--- Log ---\n"
                      << "  " << options.log_file << ": " << logger->messages_logged() << " written, "
                      << logger->messages_dropped() << " dropped\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
