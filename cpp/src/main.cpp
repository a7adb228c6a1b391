#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>
#include <thread>
#include <csignal>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "arbscan/arbitrage_scanner.hpp"
#include "arbscan/binance_client.hpp"
#include "arbscan/clock.hpp"
#include "arbscan/errors.hpp"
#include "arbscan/hyperliquid_client.hpp"
#include "arbscan/opportunity_queries.hpp"
#include "arbscan/opportunity_store.hpp"
#include "arbscan/rest_poller.hpp"
#include "arbscan/scanner_config.hpp"

namespace asio = boost::asio;
namespace ssl = asio::ssl;

static std::atomic<bool> running(true);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

namespace {

void print_stats(const arbscan::OpportunityQueries& queries) {
    const auto stats = queries.stats();
    if (!stats || stats->total_count == 0) {
        std::cout << "[Stats] No opportunities recorded yet" << std::endl;
        return;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "[Stats] Total opportunities: " << stats->total_count
        << ", average difference: " << stats->running_mean_pct << "%";
    if (stats->best) {
        oss << ", best: " << stats->best->symbol() << " (" << stats->best->pct_diff() << "%)";
    }
    std::cout << oss.str() << std::endl;

    std::ostringstream top;
    top << "[Stats] Most active:";
    for (const auto& [symbol, count] : queries.top_symbols(5)) {
        top << " " << symbol << " (" << count << ")";
    }
    std::cout << top.str() << std::endl;

    std::cout << "[Stats] Last 24h: " << queries.count_since(std::chrono::hours(24))
              << ", last 1h: " << queries.count_since(std::chrono::hours(1)) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    arbscan::ScannerConfig config;
    try {
        config = arbscan::parse_scanner_args(argc, argv);
    } catch (const arbscan::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        arbscan::print_scanner_usage(argv[0]);
        return 1;
    }
    if (config.show_help) {
        arbscan::print_scanner_usage(argv[0]);
        return 0;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        arbscan::SystemClock clock;
        auto store = arbscan::OpportunityStore::open(config.journal_path, clock);
        arbscan::OpportunityQueries queries(*store);
        arbscan::ArbitrageScanner scanner(config.symbols, config.threshold_pct, *store, clock);

        std::ostringstream banner;
        banner << "[Scanner] Watching";
        for (const auto& symbol : config.symbols) {
            banner << " " << symbol;
        }
        banner << " | threshold " << config.threshold_pct << "% | journal " << store->describe();
        std::cout << banner.str() << std::endl;
        print_stats(queries);

        // IO context for async operations
        asio::io_context ioc;

        // SSL context
        ssl::context ssl_ctx(ssl::context::tlsv12_client);
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(ssl::verify_peer);

        // Both producers feed the same ingestion path
        auto quote_callback = [&scanner](const arbscan::PriceQuote& quote) {
            scanner.on_quote(quote);
        };

        std::vector<std::shared_ptr<arbscan::WebSocketClient>> clients;
        std::shared_ptr<arbscan::RestPoller> poller;

        if (config.enable_stream) {
            auto hyperliquid = std::make_shared<arbscan::HyperliquidClient>(ioc, ssl_ctx, config.symbols);
            hyperliquid->set_callback(quote_callback);
            clients.push_back(hyperliquid);

            auto binance = std::make_shared<arbscan::BinanceClient>(ioc, ssl_ctx, config.symbols);
            binance->set_callback(quote_callback);
            clients.push_back(binance);
        }

        if (config.enable_rest) {
            poller = std::make_shared<arbscan::RestPoller>(ioc, ssl_ctx, config.symbols, config.poll_interval);
            poller->set_callback(quote_callback);
            poller->start();
        }

        for (auto& client : clients) {
            client->start();
        }

        std::cout << "[Scanner] Running. Press Ctrl+C to stop." << std::endl;

        // Keep run() alive while producers are between timers
        auto work = asio::make_work_guard(ioc);

        const unsigned num_threads = std::max(2u, std::thread::hardware_concurrency());
        std::vector<std::thread> threads;
        threads.reserve(num_threads);

        for (unsigned i = 0; i < num_threads; ++i) {
            threads.emplace_back([&ioc]() {
                ioc.run();
            });
        }

        auto next_status = std::chrono::steady_clock::now() + config.status_interval;
        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            if (std::chrono::steady_clock::now() >= next_status) {
                next_status += config.status_interval;
                const auto status = scanner.status();
                std::cout << "[Status] HL: " << status.prices_a << " prices, BN: " << status.prices_b
                          << " prices, quotes: " << status.quotes_accepted
                          << " (" << status.quotes_rejected << " rejected), opportunities in last hour: "
                          << queries.count_since(std::chrono::hours(1)) << std::endl;
            }
        }

        std::cout << "\n[Scanner] Shutting down..." << std::endl;
        if (poller) {
            poller->stop();
        }
        for (auto& client : clients) {
            client->stop();
        }
        scanner.stop();

        work.reset();
        ioc.stop();

        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }

        print_stats(queries);
        std::cout << "[Scanner] Shutdown complete." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
