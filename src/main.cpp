#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "olr/config.hpp"
#include "olr/datetime.hpp"
#include "olr/error.hpp"
#include "olr/logging.hpp"
#include "olr/resolver.hpp"
#include "olr/shapefile.hpp"

namespace po = boost::program_options;

namespace {

// Raised by SIGINT, polled by the resolver before each group.
olr::CallbackProgress *g_progress = nullptr;

extern "C" void on_interrupt(int /*signal*/) {
  if (g_progress != nullptr) {
    g_progress->cancel();
  }
}

// Splits "LAYER=VALUE" arguments into a mapping.
auto parse_mapping(const std::vector<std::string> &items, const char *option)
    -> std::map<std::string, std::string> {
  auto result = std::map<std::string, std::string>();
  for (const auto &item : items) {
    auto pos = item.find('=');
    if (pos == std::string::npos || pos == 0) {
      throw olr::ConfigurationError(std::string("--") + option +
                                    " expects LAYER=VALUE, got '" + item + "'");
    }
    result[item.substr(0, pos)] = item.substr(pos + 1);
  }
  return result;
}

auto build_config(const po::variables_map &vm) -> olr::Config {
  auto config = olr::Config();
  config.mode = olr::parse_resolution_mode(vm["mode"].as<std::string>());
  if (vm.count("datetime-field") != 0) {
    config.datetime_fields = parse_mapping(
        vm["datetime-field"].as<std::vector<std::string>>(), "datetime-field");
  }
  if (vm.count("datetime-format") != 0) {
    config.datetime_formats =
        parse_mapping(vm["datetime-format"].as<std::vector<std::string>>(),
                      "datetime-format");
  }
  if (vm.count("priority") != 0) {
    config.priority_order = vm["priority"].as<std::vector<std::string>>();
  }
  config.prefer_highest_rank = vm["prefer-highest-rank"].as<bool>();
  config.area_epsilon = vm["epsilon"].as<double>();
  config.threads = vm["threads"].as<size_t>();
  config.split_multipart = vm["split-multipart"].as<bool>();
  return config;
}

// Fills the datetime field of the layers the user did not map.
auto detect_datetime_fields(const std::vector<olr::Layer> &layers,
                            olr::Config &config) -> void {
  for (const auto &layer : layers) {
    if (config.datetime_fields.count(layer.name) != 0) {
      continue;
    }
    auto found = olr::detect_datetime_field(layer);
    if (!found) {
      BOOST_LOG_TRIVIAL(warning)
          << "No datetime field found in layer '" << layer.name << "'";
      continue;
    }
    config.datetime_fields[layer.name] = found->first;
    if (config.datetime_formats.count(layer.name) == 0) {
      config.datetime_formats[layer.name] = found->second;
    }
  }
}

}  // namespace

int main(int argc, char *argv[]) {
  po::options_description general("Options");
  // clang-format off
  general.add_options()
      ("help,h", "print this help message")
      ("output,o", po::value<std::string>(),
       "resolved shapefile to write")
      ("mode,m", po::value<std::string>()->default_value("datetime"),
       "resolution mode: datetime or priority")
      ("datetime-field", po::value<std::vector<std::string>>()->composing(),
       "LAYER=FIELD holding the survey datetime of a layer")
      ("datetime-format", po::value<std::vector<std::string>>()->composing(),
       "LAYER=FORMAT strptime format of a layer's datetime field")
      ("detect-datetime", po::bool_switch()->default_value(false),
       "detect the datetime field of the layers without --datetime-field")
      ("priority,p", po::value<std::vector<std::string>>()->composing(),
       "layer name, repeated from the highest to the lowest priority")
      ("prefer-highest-rank", po::bool_switch()->default_value(false),
       "the last layer of the priority order wins")
      ("epsilon", po::value<double>()->default_value(1e-6),
       "minimum area of an overlap or of a fragment")
      ("threads,j", po::value<size_t>()->default_value(1),
       "threads resolving groups (0 uses all CPUs)")
      ("split-multipart", po::bool_switch()->default_value(false),
       "write one feature per polygon part")
      ("overlaps", po::value<std::string>(),
       "shapefile receiving the detected overlap regions")
      ("dry-run", po::bool_switch()->default_value(false),
       "detect overlaps without resolving them")
      ("log-level", po::value<std::string>()->default_value("info"),
       "trace, debug, info, warning or error")
      ("log-dir", po::value<std::string>(),
       "directory receiving a timestamped log file")
      ("config,c", po::value<std::string>(),
       "INI file providing the same options");
  // clang-format on

  po::options_description hidden("Hidden");
  hidden.add_options()("layer", po::value<std::vector<std::string>>(),
                       "input shapefile");

  po::options_description all("Usage");
  all.add(general).add(hidden);

  po::positional_options_description positional;
  positional.add("layer", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.count("config") != 0) {
      auto filename = vm["config"].as<std::string>();
      std::ifstream stream(filename);
      if (!stream) {
        std::cerr << "Error: cannot read configuration file " << filename
                  << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(stream, all), vm);
    }
    po::notify(vm);
  } catch (const po::error &err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return 1;
  }

  if (vm.count("help") != 0 || vm.count("layer") == 0) {
    std::cerr << "Usage: " << argv[0]
              << " [options] layer1.shp [layer2.shp ...] -o output.shp\n"
              << general << std::endl;
    return vm.count("help") != 0 ? 0 : 1;
  }
  auto dry_run = vm["dry-run"].as<bool>();
  if (!dry_run && vm.count("output") == 0) {
    std::cerr << "Error: No output shapefile specified" << std::endl;
    return 1;
  }

  try {
    auto log_dir =
        vm.count("log-dir") != 0 ? vm["log-dir"].as<std::string>() : "";
    auto log_file = olr::init_logging(
        olr::parse_severity(vm["log-level"].as<std::string>()), log_dir);
    if (!log_file.empty()) {
      BOOST_LOG_TRIVIAL(info) << "Logging to " << log_file;
    }

    auto config = build_config(vm);
    auto layers = std::vector<olr::Layer>();
    for (const auto &filename : vm["layer"].as<std::vector<std::string>>()) {
      layers.emplace_back(olr::load_layer(filename));
    }
    if (config.mode == olr::ResolutionMode::datetime &&
        vm["detect-datetime"].as<bool>()) {
      detect_datetime_fields(layers, config);
    }

    auto last_percent = size_t(101);
    auto progress = olr::CallbackProgress(
        [&last_percent](size_t completed, size_t total) {
          auto percent = total == 0 ? 100 : completed * 100 / total;
          if (percent != last_percent && percent % 10 == 0) {
            BOOST_LOG_TRIVIAL(info) << "Processed " << completed << "/"
                                    << total << " features";
          }
          last_percent = percent;
        });
    g_progress = &progress;
    std::signal(SIGINT, on_interrupt);

    if (dry_run || vm.count("overlaps") != 0) {
      auto overlaps = olr::detect(layers, config, &progress);
      std::cout << overlaps.size() << " overlapping feature pairs"
                << std::endl;
      if (vm.count("overlaps") != 0) {
        olr::save_overlaps(vm["overlaps"].as<std::string>(), overlaps);
      }
      if (dry_run) {
        g_progress = nullptr;
        olr::flush_logs();
        return progress.is_cancelled() ? 130 : 0;
      }
    }

    auto report = olr::resolve(layers, config, &progress);
    g_progress = nullptr;

    for (const auto &failure : report.failures) {
      std::cerr << "Warning: " << failure.what() << std::endl;
    }
    switch (report.outcome) {
      case olr::Outcome::failed:
        std::cerr << "Error: " << report.reason << std::endl;
        olr::flush_logs();
        return 2;
      case olr::Outcome::cancelled:
        std::cerr << "Cancelled, nothing written" << std::endl;
        olr::flush_logs();
        return 130;
      case olr::Outcome::completed:
        break;
    }

    auto output = vm["output"].as<std::string>();
    std::cout << "Saving result to: " << output << std::endl;
    olr::save_features(output, report.features);
    std::cout << report.group_count << " overlap groups resolved, "
              << report.features.features.size() << " features written"
              << std::endl;
    olr::flush_logs();
    return report.failures.empty() ? 0 : 3;
  } catch (const olr::ConfigurationError &err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return 1;
  } catch (const std::exception &err) {
    BOOST_LOG_TRIVIAL(fatal) << err.what();
    olr::flush_logs();
    std::cerr << "Error: " << err.what() << std::endl;
    return 2;
  }
}
