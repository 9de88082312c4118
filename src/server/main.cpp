#include "cli.hpp"
#include "commands_processor.hpp"
#include "message_processor.hpp"
#include "shared_state.hpp"

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <fmt/format.h>

#include <csignal>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

using asio::awaitable;
using asio::co_spawn;
using asio::detached;
using asio::use_awaitable;
using asio::ip::tcp;

// Longest message a buyer may send, anything longer closes the connection
constexpr std::size_t kMaxMessageSize = 1024;

// Coroutine that invokes the callback every `interval` until it asks to stop
awaitable<void> run_periodic(std::chrono::milliseconds interval, SellerService::TickCallback on_tick) {
  auto timer = asio::steady_timer(co_await asio::this_coro::executor, interval);

  for (;;) {
    co_await timer.async_wait(use_awaitable);
    timer.expires_at(timer.expiry() + interval);

    if (!on_tick(Clock::now())) {
      co_return;
    }
  }
}

// Coroutine that processes messages of a single buyer and sends replies back
awaitable<void> process_buyer_messages(tcp::socket socket, MessageProcessor processor) {
  std::string buffer;
  try {
    for (;;) {
      std::size_t const n = co_await asio::async_read_until(socket, asio::dynamic_buffer(buffer, kMaxMessageSize),
                                                            '\n', use_awaitable);
      // The reply is computed synchronously, so no other task can interleave with the sale commit
      auto reply = processor.process_message(std::string_view(buffer.data(), n));
      buffer.erase(0, n);

      reply += '\n';
      co_await async_write(socket, asio::buffer(reply), use_awaitable);
    }
  } catch (std::exception & e) {
    fmt::print("Connection with buyer {} was closed: {}\n", processor.buyer, e.what());
  }
}

// Coroutine that periodically tells the seller about sold and expired items
awaitable<void> notify_seller(std::shared_ptr<SharedState> shared_state) {
  namespace ch = std::chrono;
  auto timer = asio::steady_timer(co_await asio::this_coro::executor, ch::seconds(1));

  for (;;) {
    co_await timer.async_wait(use_awaitable);
    timer.expires_at(timer.expiry() + ch::seconds(1));

    shared_state->flush_notifications();
  }
}

// Coroutine that listens for incoming buyer connections and spawns a new coroutine for each of them
awaitable<void> listener(uint16_t port, std::shared_ptr<SharedState> shared_state) {
  auto executor = co_await asio::this_coro::executor;
  tcp::acceptor acceptor(executor, { tcp::v4(), port });
  fmt::print("Listening for buyers on port {}\n", port);
  for (;;) {
    tcp::socket socket = co_await acceptor.async_accept(use_awaitable);

    std::error_code ec;
    auto const endpoint = socket.remote_endpoint(ec);
    std::string buyer =
        ec ? std::string("unknown") : fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
    fmt::print("Buyer {} connected\n", buyer);

    co_spawn(executor, process_buyer_messages(std::move(socket), MessageProcessor(std::move(buyer), shared_state)),
             detached);
  }
}

// Spawns a thread that reads seller commands from stdin. A separate thread is used because `asio` doesn't
// provide a way to read from stdin asynchronously. Every line is posted back to the io_context, so commands
// run on the same thread as buyer messages and price timers and never race with them.
//
// The thread is detached and may stay blocked in `getline` after shutdown, so it co-owns the io_context
// and stops posting once the context is stopped.
void spawn_console_handler(std::shared_ptr<asio::io_context> io_context, std::shared_ptr<SharedState> shared_state) {
  auto processor = std::make_shared<CommandsProcessor>(std::move(shared_state));
  std::thread([io_context = std::move(io_context), processor]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (io_context->stopped()) {
        return;
      }
      asio::post(*io_context, [processor, line]() { fmt::print("{}\n", processor->process_request(line)); });
    }
  }).detach();
}

int main(int argc, char * argv[]) {
  auto cli = Cli::parse(argc, argv);
  if (!cli) {
    fmt::print("{}\n", cli.error());
    return 1;
  }

  auto transaction_log = TransactionLog::open(cli->sales_log_path);
  if (!transaction_log) {
    fmt::print("Failed to open sales log: {}\n", transaction_log.error());
    return 1;
  }

  try {
    auto io_context = std::make_shared<asio::io_context>(1);

    // Weak, the context owns the periodic tasks and through them the shared state holding this function
    auto schedule_periodic = [weak_context = std::weak_ptr<asio::io_context>(io_context)](
                                 std::chrono::milliseconds interval, SellerService::TickCallback on_tick) {
      if (auto const context = weak_context.lock()) {
        co_spawn(*context, run_periodic(interval, std::move(on_tick)), detached);
      }
    };

    auto catalogue = std::make_shared<Catalogue>();
    auto notifications = std::make_shared<NotificationService>();
    auto shared_state = std::make_shared<SharedState>(SharedState{
        .catalogue = catalogue,
        .notifications = notifications,
        .seller_service = SellerService(catalogue, notifications, schedule_periodic,
                                        SellerService::Options{
                                            .tick_interval = cli->tick_interval,
                                            .decay_policy = cli->decay_policy,
                                        }),
        .transaction_log = std::move(*transaction_log),
    });
    fmt::print("Prices are recomputed every {}s using {} decay\n", cli->tick_interval.count(),
               to_string(cli->decay_policy));

    // Graceful shutdown
    asio::signal_set signals(*io_context, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
      fmt::print("Shutting down...\n");
      io_context->stop();
    });

    co_spawn(*io_context, listener(cli->port, shared_state), detached);
    co_spawn(*io_context, notify_seller(shared_state), detached);
    spawn_console_handler(io_context, shared_state);

    // Single-threaded on purpose: the catalogue relies on one task running at a time
    io_context->run();

    // Sales and expirations since the last periodic flush still belong in the sales log
    shared_state->flush_notifications();
  } catch (std::exception & e) {
    fmt::print("Exception: {}\n", e.what());
    return 1;
  }

  return 0;
}
