#include <cpptrace/cpptrace.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "command_line_parser.hpp"
#include "exec_channel.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "transfer_config.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitProbeFailed = 2;
constexpr int kExitChannelUnavailable = 3;
constexpr std::size_t kMeterWidth = 40;

std::string format_meter(uint64_t fetched, uint64_t total) {
  std::string bar(kMeterWidth, '_');
  if(total > 0) {
    const auto filled = static_cast<std::size_t>(std::min<uint64_t>(fetched, total) * kMeterWidth / total);
    std::fill(bar.begin(), bar.begin() + static_cast<std::ptrdiff_t>(filled), '#');
  }
  return "[" + bar + "]";
}

ProcessExecChannel::Options channel_options(const SettingsManager& settings) {
  ProcessExecChannel::Options options;
  options.program = settings.get<std::string>("channel_program");
  options.app_id = settings.get<std::string>("channel_app_id");
  const auto args = settings.get<nlohmann::json>("channel_args");
  if(!args.is_array()) throw std::invalid_argument("channel_args must be a JSON array");
  for(const auto& arg : args) {
    if(!arg.is_string()) throw std::invalid_argument("channel_args entries must be strings");
    options.args.push_back(arg.get<std::string>());
  }
  return options;
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    const auto config_path = CommandLineParser::find_config_path(argc, argv);
    if(!config_path.empty()) {
      settings->set_settings_path(config_path);
    }
    settings->load();
    settings->apply_environment();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "tarpull");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const std::invalid_argument&) {
      parser.usage();
      return kExitFailed;
    }
    if(settings->help_requested()) {
      parser.usage();
      return kExitOk;
    }

    init(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    Logger logger("tarpull");
    logger.debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger.error("Unable to persist settings to {}", settings->settings_path().string());
      } else {
        logger.info("Settings saved to {}", settings->settings_path().string());
      }
    }

    const auto source_id = settings->get<std::string>("source_id");
    const auto item_id = settings->get<std::string>("item_id");
    if(source_id.empty() || item_id.empty()) {
      if(settings->save_requested()) return kExitOk;
      print_err("Both source_id and item_id are required");
      parser.usage();
      return kExitFailed;
    }

    TransferConfig config;
    try {
      config = load_transfer_config(*settings);
    } catch(const std::invalid_argument& e) {
      print_err("Invalid configuration: {}", e.what());
      return kExitFailed;
    }

    auto channel_logger = std::make_shared<Logger>("channel");
    auto process_channel = std::make_shared<ProcessExecChannel>(channel_options(*settings), channel_logger);
    const int timeout_retries = std::max(0, settings->get<int>("channel_timeout_retries"));
    BackoffPolicy timeout_policy{static_cast<std::size_t>(timeout_retries) + 1,
                                 std::chrono::milliseconds(1000),
                                 std::chrono::milliseconds(10000)};
    auto channel = std::make_shared<RetryingExecChannel>(process_channel, timeout_policy,
                                                         SleepFunction(), channel_logger);

    const bool show_progress = settings->get<bool>("transfer_progress");
    std::size_t meter_line_width = 0;
    TransferEngine::Options options;
    if(show_progress) {
      options.progress = [&](std::size_t index, std::size_t count, uint64_t fetched, uint64_t total){
        std::ostringstream line;
        line << "\rFetching " << source_id << "/" << item_id << " " << format_meter(fetched, total)
             << " " << (index + 1) << "/" << count << " " << format_size(fetched) << "/" << format_size(total);
        auto rendered = line.str();
        std::cout << rendered;
        if(rendered.size() < meter_line_width) {
          std::cout << std::string(meter_line_width - rendered.size(), ' ');
        } else {
          meter_line_width = rendered.size();
        }
        if(index + 1 == count) {
          std::cout << "\n";
          meter_line_width = 0;
        }
        std::cout.flush();
      };
    }

    TransferEngine engine(channel, config, options);

    try {
      // a cached item needs no channel at all
      if(!engine.is_cached(source_id, item_id) && !engine.probe_channel()) {
        logger.error("Exec channel {} did not answer the probe", process_channel->options().program);
        return kExitProbeFailed;
      }

      const auto started = std::chrono::steady_clock::now();
      auto outcome = engine.download_and_extract(source_id, item_id);
      const auto elapsed = std::chrono::steady_clock::now() - started;

      if(outcome.success) {
        if(outcome.cache_hit) {
          logger.print("{} (cached)", outcome.local_path.string());
        } else {
          logger.print("{} ({}, {}, {})", outcome.local_path.string(), format_size(outcome.archive_size),
                       outcome.integrity == IntegrityStatus::Verified ? "md5 " + outcome.digest
                                                                      : std::string("md5 unverified"),
                       format_duration_compact(elapsed));
        }
        return kExitOk;
      }

      if(outcome.failure) {
        const auto& failure = *outcome.failure;
        logger.error("{}/{} failed after {} attempt(s): {} at {}: {}", source_id, item_id, outcome.attempts,
                     to_string(failure.kind), to_string(failure.stage), failure.message);
      }
      return kExitFailed;
    } catch(const ChannelUnavailable& e) {
      logger.error("Exec channel unavailable: {}", e.what());
      return kExitChannelUnavailable;
    }
  } catch(const std::invalid_argument& e) {
    print_err("{}", e.what());
    return kExitFailed;
  } catch(std::exception& e) {
    init(false);
    Logger logger("tarpull-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return kExitFailed;
  }
}
