/**
 * @file replay_from_csv.cpp
 * @brief Replay an order script from a CSV file through the matching engine
 *
 * CSV Format (one command per line, '#' starts a comment):
 *   L,B,100.00,10,alice     (Limit buy 10 @ 100.00 for alice)
 *   L,S,99.50,5,bob         (Limit sell 5 @ 99.50 for bob)
 *   M,B,,15,carol           (Market buy 15 for carol)
 *   C,1                     (Cancel order 1)
 */

#include <lobsim/common/types.hpp>
#include <lobsim/common/time.hpp>
#include <lobsim/engine/matching_engine.hpp>

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lobsim;

enum class CommandType : std::uint8_t {
    Limit,
    Market,
    Cancel
};

struct CsvCommand {
    CommandType type{CommandType::Limit};
    Side side{Side::Buy};
    Price price{0.0};
    Qty qty{0};
    std::string owner;
    OrderId order_id{constants::INVALID_ORDER_ID};
    std::size_t line{0};
};

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        tokens.push_back(token);
    }
    return tokens;
}

Side parse_side(const std::string& field, std::size_t line_no) {
    if (field == "B" || field == "Buy" || field == "BUY") {
        return Side::Buy;
    }
    if (field == "S" || field == "Sell" || field == "SELL") {
        return Side::Sell;
    }
    throw std::invalid_argument("line " + std::to_string(line_no) + ": bad side '" + field + "'");
}

std::optional<CsvCommand> parse_line(const std::string& line, std::size_t line_no) {
    auto tokens = split(line);
    if (tokens.empty() || tokens[0].empty()) {
        return std::nullopt;
    }

    CsvCommand cmd;
    cmd.line = line_no;

    switch (tokens[0][0]) {
        case 'L':
        case 'M':
            if (tokens.size() < 5 || tokens[1].empty()) {
                throw std::invalid_argument("line " + std::to_string(line_no) + ": expected 5 fields");
            }
            cmd.type = (tokens[0][0] == 'L') ? CommandType::Limit : CommandType::Market;
            cmd.side = parse_side(tokens[1], line_no);
            if (cmd.type == CommandType::Limit) {
                cmd.price = Price{std::stod(tokens[2])};
            }
            cmd.qty = Qty{std::stoll(tokens[3])};
            cmd.owner = tokens[4];
            return cmd;

        case 'C':
            if (tokens.size() < 2) {
                throw std::invalid_argument("line " + std::to_string(line_no) + ": missing order id");
            }
            cmd.type = CommandType::Cancel;
            cmd.order_id = OrderId{std::stoull(tokens[1])};
            return cmd;

        default:
            throw std::invalid_argument("line " + std::to_string(line_no) + ": unknown command '" +
                                        tokens[0] + "'");
    }
}

std::vector<CsvCommand> parse_csv(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    std::vector<CsvCommand> commands;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') continue;

        if (auto cmd = parse_line(line, line_no)) {
            commands.push_back(std::move(*cmd));
        }
    }

    return commands;
}

void print_result(const SubmitResult& result) {
    std::cout << "  -> " << to_string(result.result);
    if (result.order_id) {
        std::cout << " id=" << result.order_id->get();
    }
    if (!result.accepted) {
        std::cout << " (" << to_string(result.reason) << ")";
    }
    std::cout << " filled=" << result.qty_filled.get()
              << " state=" << to_string(result.state()) << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <csv_file>\n";
        std::cout << "\nCSV Format:\n";
        std::cout << "  L,B,100.00,10,alice   (Limit buy)\n";
        std::cout << "  L,S,99.50,5,bob       (Limit sell)\n";
        std::cout << "  M,B,,15,carol         (Market buy)\n";
        std::cout << "  C,1                   (Cancel)\n";
        return 1;
    }

    try {
        std::string filename = argv[1];
        std::cout << "Reading orders from: " << filename << "\n";

        auto commands = parse_csv(filename);
        std::cout << "Parsed " << commands.size() << " commands\n\n";

        MatchingEngine engine;
        std::cout << std::fixed << std::setprecision(2);

        engine.add_fill_listener([&engine](const Fill& fill) {
            std::cout << "  FILL: #" << fill.order_id.get()
                      << " " << engine.participant_name(fill.participant)
                      << " " << to_string(fill.side) << " " << fill.qty.get()
                      << " @ " << fill.price.get()
                      << " (" << fill.qty_remaining.get() << " left)\n";
        });

        Timestamp start = now_ns();

        for (const auto& cmd : commands) {
            switch (cmd.type) {
                case CommandType::Limit:
                    std::cout << "LIMIT: " << cmd.owner << " " << to_string(cmd.side)
                              << " " << cmd.qty.get() << " @ " << cmd.price.get() << "\n";
                    print_result(engine.submit_limit(cmd.side, cmd.price, cmd.qty, cmd.owner));
                    break;

                case CommandType::Market:
                    std::cout << "MARKET: " << cmd.owner << " " << to_string(cmd.side)
                              << " " << cmd.qty.get() << "\n";
                    print_result(engine.submit_market(cmd.side, cmd.qty, cmd.owner));
                    break;

                case CommandType::Cancel:
                    std::cout << "CANCEL: id=" << cmd.order_id.get() << "\n";
                    std::cout << "  -> " << (engine.cancel(cmd.order_id) ? "Cancelled" : "NotFound") << "\n";
                    break;
            }
        }

        Timestamp end = now_ns();
        double elapsed_ms = ns_to_ms(static_cast<Duration>(end - start));

        // Print summary
        std::cout << "\n=== Trades ===\n";
        for (const auto& trade : engine.trade_log()) {
            std::cout << "  " << trade.qty.get() << " @ " << trade.price.get()
                      << " (buy=#" << trade.buy_order_id.get()
                      << ", sell=#" << trade.sell_order_id.get()
                      << ", aggressor=" << to_string(trade.aggressor_side) << ")\n";
        }

        std::cout << "\n=== Replay Summary ===\n";
        std::cout << "Commands processed: " << commands.size() << "\n";
        std::cout << "Trades executed:    " << engine.trade_count() << "\n";
        std::cout << "Trade volume:       " << engine.stats().volume.load() << "\n";
        std::cout << "Elapsed time:       " << elapsed_ms << " ms\n";

        std::cout << "\n=== Final Book State ===\n";
        BookSnapshot book = engine.get_book();
        std::cout << "Resting orders: " << engine.order_count() << "\n";
        for (const auto& level : book.asks) {
            std::cout << "  ASK " << level.price.get() << " x " << level.qty.get()
                      << " (" << level.order_count << " orders)\n";
        }
        for (const auto& level : book.bids) {
            std::cout << "  BID " << level.price.get() << " x " << level.qty.get()
                      << " (" << level.order_count << " orders)\n";
        }
        if (auto spread = engine.spread()) {
            std::cout << "Spread:         " << *spread << "\n";
        }

        std::cout << "\n=== Positions ===\n";
        for (const auto& account : engine.accounts()) {
            std::cout << "  " << engine.participant_name(account.participant)
                      << ": position=" << account.position
                      << " cash=" << account.cash << "\n";
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
