#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/backup_merger.hpp"
#include "internal/merge/progress.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schema/entity_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

using jwlmerge::observability::IntField;
using jwlmerge::observability::StringField;

namespace {

struct Options {
  std::string config_path;
  std::string output_dir;
  std::string source;
  std::string destination;
};

void PrintUsage() {
  std::cerr << "Usage: jwlmerge [--config <config.yaml>] [--output-dir <dir>] <source.jwlibrary> <destination.jwlibrary>" << std::endl;
}

bool ParseArgs(int argc, char** argv, Options* options) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--config" || arg == "--output-dir") && i + 1 < argc) {
      (arg == "--config" ? options->config_path : options->output_dir) = argv[++i];
    } else if (arg.rfind("--", 0) == 0) {
      return false;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 2) return false;
  options->source      = positional[0];
  options->destination = positional[1];
  return true;
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseArgs(argc, argv, &options)) {
    PrintUsage();
    return 1;
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  jwlmerge::runtime::config::RuntimeConfig config;
  try {
    config = options.config_path.empty() ? jwlmerge::config::ConfigLoader::Defaults()
                                         : jwlmerge::config::ConfigLoader::LoadFromYaml(options.config_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  if (!options.output_dir.empty()) config.mutable_output()->set_directory(options.output_dir);

  try {
    jwlmerge::observability::InitializeLogging(config);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  try {
    const auto source      = jwlmerge::util::ReadFileBytes(options.source, jwlmerge::util::Phase::Extract);
    const auto destination = jwlmerge::util::ReadFileBytes(options.destination, jwlmerge::util::Phase::Extract);

    jwlmerge::merge::CallbackProgressSink progress([](int value, const std::string& message) {
      JWLMERGE_LOG_INFO(message, {IntField("progress", value)});
    });

    jwlmerge::core::BackupMerger merger(config);
    auto                         outcome = merger.Merge(source, destination, &progress);

    const auto output = std::filesystem::path(config.output().directory()) / outcome.file_name;
    jwlmerge::util::WriteFileBytes(output, outcome.archive, jwlmerge::util::Phase::Pack);

    for (const auto& warning : outcome.report.AllWarnings()) {
      JWLMERGE_LOG_WARN("Merged with warning", {StringField("table", jwlmerge::schema::ToString(warning.kind)), StringField("column", warning.column),
                                                IntField("source_id", warning.source_id.value_or(-1))});
    }
    JWLMERGE_LOG_INFO("Wrote merged backup", {StringField("path", output.string())});
    std::cout << output.string() << std::endl;
  } catch (const jwlmerge::util::MergeError& e) {
    JWLMERGE_LOG_ERROR("Merge failed", {StringField("kind", e.kind()), StringField("phase", jwlmerge::util::ToString(e.phase())),
                                        StringField("error", e.what())});
    jwlmerge::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    JWLMERGE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    jwlmerge::observability::ShutdownLogging();
    return 2;
  }

  jwlmerge::observability::ShutdownLogging();
  return 0;
}
