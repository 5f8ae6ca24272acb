// Command line driver around the compression core. Reads a recorded track,
// applies the configured compression policy and prints a JSON report.
//
//   trackcompress <track.json> [settings.json]

#include "app/CompressionPolicy.hpp"
#include "app/Settings.hpp"
#include "debug/json_debug.hpp"
#include "debug/track_inspect.hpp"
#include "io/TrackReader.hpp"
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using json = nlohmann::json;

static void usage(const char *argv0) {
  std::cerr << "usage: " << argv0 << " <track.json> [settings.json]\n";
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage(argv[0]);
    return 2;
  }
  const std::string track_path = argv[1];
  const std::string settings_path =
      argc > 2 ? argv[2] : "config/settings.json";

  // ---------------------- Load configuration ------------------------------
  tc::Settings settings;
  try {
    settings = tc::Settings::load(settings_path);
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] settings " << settings_path << ": " << e.what()
              << "\n";
    return 1;
  }
  if (settings.verbose)
    std::cerr << "[DEBUG] params " << settings.compression.to_json().dump()
              << "\n";

  // ---------------------- Load track --------------------------------------
  tc::Track track;
  std::string text;
  try {
    text = tc::TrackReader::slurp(track_path);
    track = tc::TrackReader::from_text(text);
  } catch (const json::parse_error &e) {
    std::cerr << "[ERROR] " << track_path << " is not valid JSON\n"
              << tc::describe_parse_error(text, e).dump(2) << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << track_path << ": " << e.what() << "\n";
    return 1;
  }
  if (settings.verbose)
    std::cerr << "[DEBUG] loaded " << track.size() << " samples from "
              << track_path << "\n";

  // ---------------------- Compress + validate -----------------------------
  tc::CompressionPolicy policy(settings.compression, settings.policy,
                               settings.verbose);
  const tc::PolicyOutcome outcome = policy.run(track);

  json report = outcome.to_json();
  report["summary"] = tc::summarize(track, outcome.result);
  report["params"] = settings.compression.to_json();
  std::cout << report.dump(2) << std::endl;
  return 0;
}
