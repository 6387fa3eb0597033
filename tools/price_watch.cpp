#include "config.hpp"
#include "errors.hpp"
#include "http_quote_source.hpp"
#include "instrument_set.hpp"
#include "publisher.hpp"
#include "refresh_scheduler.hpp"
#include "replay_quote_source.hpp"
#include "window_store.hpp"
#include "zoom_state.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

namespace {

struct ToolOptions {
  pricewatch::WatchConfig watch;
  std::string source{"http"};
  std::string input_path;
  pricewatch::HttpQuoteConfig http;
  std::string nats_url;
  pricewatch::JetStreamConfig jetstream;
  int duration_sec{0};
};

void usage() {
  std::cerr << "Usage: price_watch [--instruments A,B,C] [--mode auto|manual] "
            << "[--period-ms N] [--capacity N] [--crash-ratio R] "
            << "[--source http|replay] [--input FILE] [--host HOST] "
            << "[--insecure-tls] [--nats-url URL] [--stream NAME] "
            << "[--subject-root ROOT] [--duration-sec N] [--quiet]\n"
            << "Commands (stdin): r refresh, s SYMBOL select, + zoom in, "
            << "- zoom out, 0 reset zoom, q quit\n";
}

bool parse_args(int argc, char **argv, ToolOptions &opts) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--instruments" && i + 1 < argc) {
      opts.watch.instruments = pricewatch::parse_instrument_list(argv[++i]);
    } else if (arg == "--mode" && i + 1 < argc) {
      opts.watch.scheduler.mode = pricewatch::parse_refresh_mode(argv[++i]);
    } else if (arg == "--period-ms" && i + 1 < argc) {
      opts.watch.scheduler.period = std::chrono::milliseconds(std::stol(argv[++i]));
    } else if (arg == "--capacity" && i + 1 < argc) {
      opts.watch.capacity = std::stoul(argv[++i]);
    } else if (arg == "--crash-ratio" && i + 1 < argc) {
      opts.watch.scheduler.policy.crash_ratio = std::stod(argv[++i]);
    } else if (arg == "--source" && i + 1 < argc) {
      opts.source = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      opts.input_path = argv[++i];
    } else if (arg == "--host" && i + 1 < argc) {
      opts.http.host = argv[++i];
    } else if (arg == "--insecure-tls") {
      opts.http.insecure_tls = true;
    } else if (arg == "--nats-url" && i + 1 < argc) {
      opts.nats_url = argv[++i];
    } else if (arg == "--stream" && i + 1 < argc) {
      opts.jetstream.stream = argv[++i];
    } else if (arg == "--subject-root" && i + 1 < argc) {
      opts.jetstream.subject_root = argv[++i];
    } else if (arg == "--duration-sec" && i + 1 < argc) {
      opts.duration_sec = std::stoi(argv[++i]);
    } else if (arg == "--quiet") {
      opts.watch.scheduler.verbose = false;
    } else if (arg == "--help") {
      usage();
      return false;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      usage();
      return false;
    }
  }
  if (opts.source != "http" && opts.source != "replay") {
    std::cerr << "unknown source: " << opts.source << "\n";
    usage();
    return false;
  }
  if (opts.source == "replay" && opts.input_path.empty()) {
    std::cerr << "--source replay requires --input FILE\n";
    usage();
    return false;
  }
  return true;
}

/// Reads commands until 'q' or end of input
void command_loop(pricewatch::RefreshScheduler &scheduler,
                  pricewatch::ZoomState &zoom,
                  pricewatch::FramePublisher &console) {
  std::string line;
  while (std::getline(std::cin, line)) {
    std::stringstream ss(line);
    std::string cmd;
    if (!(ss >> cmd)) {
      continue;
    }

    try {
      auto selected = scheduler.selected();
      if (cmd == "q") {
        return;
      } else if (cmd == "r") {
        if (!selected) {
          std::cerr << "nothing selected; use: s SYMBOL\n";
          continue;
        }
        scheduler.trigger(*selected);
      } else if (cmd == "s") {
        std::string symbol;
        if (!(ss >> symbol)) {
          std::cerr << "usage: s SYMBOL\n";
          continue;
        }
        if (!scheduler.select(symbol)) {
          console.publish(scheduler.frame(symbol));
        }
      } else if (cmd == "+" || cmd == "-" || cmd == "0") {
        double factor = cmd == "+" ? zoom.zoom_in()
                        : cmd == "-" ? zoom.zoom_out()
                                     : zoom.reset();
        std::cout << "zoom=" << factor << "\n";
        if (selected) {
          console.publish(scheduler.frame(*selected));
        }
      } else {
        std::cerr << "unknown command: " << cmd << "\n";
      }
    } catch (const pricewatch::UnknownInstrumentError &ex) {
      std::cerr << ex.what() << "\n";
    }
  }
}

} // namespace

int main(int argc, char **argv) {
  ToolOptions opts;
  try {
    if (!parse_args(argc, argv, opts)) {
      return 1;
    }
    opts.watch.validate();
  } catch (const std::exception &ex) {
    std::cerr << "invalid configuration: " << ex.what() << "\n";
    return 1;
  }

  std::unique_ptr<pricewatch::QuoteSource> source;
  std::ifstream input;
  if (opts.source == "replay") {
    input.open(opts.input_path);
    if (!input.is_open()) {
      std::cerr << "failed to open input file: " << opts.input_path << "\n";
      return 1;
    }
    auto replay = std::make_unique<pricewatch::ReplayQuoteSource>(input);
    std::cout << "loaded " << replay->loaded_count() << " quotes ("
              << replay->skipped_lines() << " lines skipped)" << std::endl;
    source = std::move(replay);
  } else {
    source = std::make_unique<pricewatch::HttpQuoteSource>(opts.http);
  }

  pricewatch::InstrumentSet instruments(opts.watch.instruments);
  pricewatch::WindowStore store(opts.watch.capacity);
  pricewatch::ZoomState zoom(opts.watch.min_zoom, opts.watch.max_zoom);
  pricewatch::RefreshScheduler scheduler(opts.watch.scheduler, instruments,
                                         store, *source, zoom);

  auto console = std::make_shared<pricewatch::ConsolePublisher>(std::cout);
  scheduler.add_publisher(console);

  if (!opts.nats_url.empty()) {
    opts.jetstream.url = opts.nats_url;
    try {
      scheduler.add_publisher(
          std::make_shared<pricewatch::JetStreamPublisher>(opts.jetstream));
    } catch (const std::exception &ex) {
      std::cerr << "failed to initialize JetStream publisher: " << ex.what()
                << "\n";
      return 1;
    }
  }

  scheduler.start();

  // Manual mode shows the first instrument right away
  if (opts.watch.scheduler.mode == pricewatch::RefreshMode::MANUAL) {
    auto selected = scheduler.selected();
    if (selected && !scheduler.select(*selected)) {
      console->publish(scheduler.frame(*selected));
    }
  }

  if (opts.watch.scheduler.mode == pricewatch::RefreshMode::AUTOMATIC &&
      opts.duration_sec > 0) {
    std::this_thread::sleep_for(std::chrono::seconds(opts.duration_sec));
  } else {
    command_loop(scheduler, zoom, *console);
  }

  scheduler.stop();
  return 0;
}
