/*
================================================================================
CLI: Main Entry Point (clirisk_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end for the climate fragility engine.
  - Reads HBOM records, fragility-curve documents and a prepared climate
    dataset as JSON; writes the reconstructed tree, the curve-annotated tree,
    the PoF time series, or the flattened HBOM as deterministic JSON.

Usage:
  clirisk_cli <command> [options]

Commands:
  hazards      List the hazard catalog
  reconstruct  --hbom F [--curves F] [--hazard H] [--sector S]
  compute      --hbom F --curves F --climate F --hazard H [--sector S]
  timeseries   --hbom F --curves F --climate F --hazard H
  flatten      --hbom F [--curves F]
  help         Show help message

Options (all commands):
  --config <path>                      JSON engine settings
  --out <path|->                       Output file (default "-": stdout)
  --pretty 0|1                         Pretty JSON (default from config, 1)
  --log-level debug|info|warn|error
  --selection first|priority|conditions
  --composites 0|1                     Derive hazard composite variables

Input paths accept "-" for stdin (at most one input may use it).

Exit codes:
  0  success
  1  invalid arguments / invalid configuration
  2  parse error (malformed JSON or unexpected document shape)
  3  computation error (cyclic HBOM, depth guard, internal)
  4  I/O error
================================================================================
*/

#include "engine/climate/composites.hpp"
#include "engine/climate/hazard_catalog.hpp"
#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/fragility/distribution.hpp"
#include "engine/fragility/fragility_computer.hpp"
#include "engine/fragility/grid_reducer.hpp"
#include "engine/fragility/reliability_combiner.hpp"
#include "engine/hbom/curve_selection.hpp"
#include "engine/hbom/tree_reconstructor.hpp"
#include "engine/io/hbom_json.hpp"
#include "engine/io/json_value.hpp"
#include "engine/io/json_writer.hpp"
#include "engine/io/settings_json.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using namespace clirisk;

namespace {

struct Args {
  std::string command;

  std::string hbom_path;
  std::string curves_path;
  std::string climate_path;
  std::string config_path;
  std::string out_path = "-";

  std::string hazard;
  std::string sector;

  std::optional<bool> pretty;
  std::optional<LogLevel> log_level;
  std::optional<CurveSelection> selection;
  std::optional<bool> composites;
};

// Failure that already knows its exit code and message.
struct CliFailure {
  int code;
  std::string message;
};

void print_help(std::ostream& os) {
  os << R"(
clirisk_cli - Climate Fragility Engine

Usage:
  clirisk_cli <command> [options]

Commands:
  hazards       List the hazard catalog
  reconstruct   --hbom F [--curves F] [--hazard H] [--sector S]
  compute       --hbom F --curves F --climate F --hazard H [--sector S]
  timeseries    --hbom F --curves F --climate F --hazard H
  flatten       --hbom F [--curves F]
  help          Show this help message

Options:
  --config <path>                        JSON engine settings
  --out <path|->                         Output file (default stdout)
  --pretty 0|1
  --log-level debug|info|warn|error
  --selection first|priority|conditions
  --composites 0|1

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Parse error
  3 - Computation failed
  4 - I/O error
)";
}

bool parse_bool01(const char* s, bool* out) {
  if (!s || !out) return false;
  if (std::strcmp(s, "1") == 0) { *out = true; return true; }
  if (std::strcmp(s, "0") == 0) { *out = false; return true; }
  return false;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (!a) return false;
  if (argc < 2) {
    a->command = "help";
    return true;
  }
  a->command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    auto need = [&](const char* what) -> bool {
      if (get_next(i, argc, argv, &v)) return true;
      if (err) *err = std::string(k) + " requires " + what;
      return false;
    };

    if (std::strcmp(k, "--hbom") == 0) {
      if (!need("a path")) return false;
      a->hbom_path = v;
    } else if (std::strcmp(k, "--curves") == 0) {
      if (!need("a path")) return false;
      a->curves_path = v;
    } else if (std::strcmp(k, "--climate") == 0) {
      if (!need("a path")) return false;
      a->climate_path = v;
    } else if (std::strcmp(k, "--config") == 0) {
      if (!need("a path")) return false;
      a->config_path = v;
    } else if (std::strcmp(k, "--out") == 0) {
      if (!need("a path")) return false;
      a->out_path = v;
    } else if (std::strcmp(k, "--hazard") == 0) {
      if (!need("a name")) return false;
      a->hazard = v;
    } else if (std::strcmp(k, "--sector") == 0) {
      if (!need("a name")) return false;
      a->sector = v;
    } else if (std::strcmp(k, "--pretty") == 0) {
      if (!need("0|1")) return false;
      bool b = true;
      if (!parse_bool01(v, &b)) { if (err) *err = "--pretty must be 0 or 1"; return false; }
      a->pretty = b;
    } else if (std::strcmp(k, "--composites") == 0) {
      if (!need("0|1")) return false;
      bool b = true;
      if (!parse_bool01(v, &b)) { if (err) *err = "--composites must be 0 or 1"; return false; }
      a->composites = b;
    } else if (std::strcmp(k, "--log-level") == 0) {
      if (!need("a level")) return false;
      LogLevel lvl = LogLevel::INFO;
      if (!parse_log_level(v, &lvl)) { if (err) *err = "--log-level must be debug|info|warn|error"; return false; }
      a->log_level = lvl;
    } else if (std::strcmp(k, "--selection") == 0) {
      if (!need("a strategy")) return false;
      CurveSelection s = CurveSelection::kFirst;
      if (!parse_curve_selection(v, &s)) { if (err) *err = "--selection must be first|priority|conditions"; return false; }
      a->selection = s;
    } else {
      if (err) *err = std::string("Unknown argument: ") + k;
      return false;
    }
  }
  return true;
}

bool read_file(const std::string& path, std::string* out) {
  if (!out) return false;
  std::ostringstream ss;
  if (path == "-") {
    ss << std::cin.rdbuf();
  } else {
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) return false;
    ss << f.rdbuf();
  }
  *out = ss.str();
  return true;
}

bool write_output(const std::string& path, const std::string& data) {
  if (path == "-") {
    std::cout << data;
    std::cout.flush();
    return std::cout.good();
  }
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.good()) return false;
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  return f.good();
}

io::JsonValue load_json(const std::string& path, const char* what) {
  std::string text;
  if (!read_file(path, &text)) {
    throw CliFailure{kExitIoError, std::string("IO error: failed to read ") + what + ": " + path};
  }
  io::JsonValue root;
  io::JsonParseError perr;
  if (!io::parse_json(text, &root, &perr)) {
    throw CliFailure{kExitParseFailed, std::string("Parse error in ") + what + " (" + path + "): " +
                                       io::format_parse_error(perr)};
  }
  return root;
}

[[noreturn]] void schema_failure(const char* what, const std::string& path, const io::JsonParseError& e) {
  throw CliFailure{kExitParseFailed, std::string("Invalid ") + what + " (" + path + "): " + e.message};
}

EngineSettings load_settings(const Args& a) {
  EngineSettings s = EngineSettings::defaults();
  if (!a.config_path.empty()) {
    const io::JsonValue root = load_json(a.config_path, "config");
    io::JsonParseError e;
    if (!io::read_engine_settings(root, &s, &e)) schema_failure("config", a.config_path, e);
  }

  if (a.pretty) s.output.pretty = *a.pretty;
  if (a.log_level) s.log_level = *a.log_level;
  if (a.selection) s.tree.curve_selection = *a.selection;
  if (a.composites) s.apply_composites = *a.composites;

  s.validate_or_throw();
  return s;
}

io::JsonWriteOptions write_options(const EngineSettings& s) {
  io::JsonWriteOptions o;
  o.pretty = s.output.pretty;
  o.indent_spaces = s.output.indent_spaces;
  o.emit_null_for_unset = s.output.emit_null_for_unset;
  return o;
}

void require(const std::string& value, const char* flag) {
  if (value.empty()) throw CliFailure{kExitInvalidArgs, std::string("Argument error: missing ") + flag};
}

// Tree for `--sector`, scoped to `--hazard` when one is given.
hbom::HbomTree load_tree(const Args& a, const EngineSettings& s) {
  require(a.hbom_path, "--hbom");

  std::vector<hbom::FlatHbomRecord> records;
  {
    const io::JsonValue root = load_json(a.hbom_path, "HBOM");
    io::JsonParseError e;
    if (!io::read_flat_records(root, &records, &e)) schema_failure("HBOM", a.hbom_path, e);
  }

  std::vector<hbom::FragilityCurveDoc> curves;
  if (!a.curves_path.empty()) {
    const io::JsonValue root = load_json(a.curves_path, "curves");
    io::JsonParseError e;
    if (!io::read_curve_documents(root, &curves, &e)) schema_failure("curves", a.curves_path, e);
  }

  const auto selector = hbom::make_curve_selector(s.tree.curve_selection);
  hbom::ReconstructOptions opt;
  opt.max_depth = s.tree.max_depth;
  return hbom::build_hbom_tree(a.sector, records, curves, a.hazard, *selector, opt);
}

climate::PreparedClimateDataset load_climate(const Args& a, const EngineSettings& s) {
  require(a.climate_path, "--climate");

  climate::PreparedClimateDataset ds;
  const io::JsonValue root = load_json(a.climate_path, "climate dataset");
  io::JsonParseError e;
  if (!io::read_climate_dataset(root, &ds, &e)) schema_failure("climate dataset", a.climate_path, e);

  if (const std::size_t n = ds.misaligned_series()) {
    log(LogLevel::WARN, "climate: " + std::to_string(n) + " series differ in length from times");
  }

  if (s.apply_composites) {
    const climate::HazardCatalog catalog = climate::make_default_hazard_catalog();
    if (const climate::HazardDefinition* def = catalog.find(a.hazard)) {
      const climate::CompositeRegistry registry = climate::make_default_composite_registry();
      climate::apply_hazard_composites(registry, *def, ds);
    }
  }
  return ds;
}

std::string cmd_hazards(const EngineSettings& s) {
  const climate::HazardCatalog catalog = climate::make_default_hazard_catalog();

  std::ostringstream ss;
  const io::JsonWriteOptions opt = write_options(s);
  io::JsonWriter w(ss, opt);
  w.begin_object();
  w.key("hazards");
  w.begin_array();
  for (const auto& h : catalog.all()) {
    w.begin_object();
    w.key("name");                w.string(h.name);
    w.key("display_name");        w.string(h.display_name);
    w.key("base_variables");      w.string_array(h.base_variables);
    w.key("composite_variables"); w.string_array(h.composite_variables);
    w.key("description");         w.string(h.description);
    w.end_object();
  }
  w.end_array();
  w.end_object();
  if (opt.pretty) ss << "\n";
  return ss.str();
}

std::string cmd_reconstruct(const Args& a, const EngineSettings& s) {
  return io::tree_to_json(load_tree(a, s), write_options(s), /*include_results=*/false);
}

std::string cmd_flatten(const Args& a, const EngineSettings& s) {
  const hbom::HbomTree tree = load_tree(a, s);
  std::ostringstream ss;
  io::write_flat_hbom_json(ss, hbom::flatten(tree.components), write_options(s));
  return ss.str();
}

std::string cmd_compute(const Args& a, const EngineSettings& s, bool timeseries) {
  require(a.hazard, "--hazard");
  require(a.curves_path, "--curves");

  const hbom::HbomTree tree = load_tree(a, s);
  const climate::PreparedClimateDataset data = load_climate(a, s);

  const fragility::DistributionEvaluator evaluator(s.fragility);
  const fragility::MaxGridReducer reducer;
  const fragility::SeriesReliabilityCombiner combiner;
  const fragility::FragilityComputer computer(evaluator, reducer, combiner);

  if (timeseries) {
    return io::timeseries_to_json(computer.compute_timeseries(tree, a.hazard, data), write_options(s));
  }
  return io::tree_to_json(computer.compute_for_tree(tree, a.hazard, data), write_options(s));
}

}  // namespace

int main(int argc, char** argv) {
  Args a;
  std::string arg_err;
  if (!parse_args(argc, argv, &a, &arg_err)) {
    std::cerr << "Argument error: " << arg_err << "\n";
    print_help(std::cerr);
    return kExitInvalidArgs;
  }

  if (a.command == "help" || a.command == "-h" || a.command == "--help") {
    print_help(std::cout);
    return kExitOk;
  }

  try {
    const EngineSettings s = load_settings(a);
    set_log_level(s.log_level);

    std::string out;
    if (a.command == "hazards") {
      out = cmd_hazards(s);
    } else if (a.command == "reconstruct") {
      out = cmd_reconstruct(a, s);
    } else if (a.command == "compute") {
      out = cmd_compute(a, s, /*timeseries=*/false);
    } else if (a.command == "timeseries") {
      out = cmd_compute(a, s, /*timeseries=*/true);
    } else if (a.command == "flatten") {
      out = cmd_flatten(a, s);
    } else {
      std::cerr << "Unknown command: " << a.command << "\n";
      std::cerr << "Run 'clirisk_cli help' for usage information.\n";
      return kExitInvalidArgs;
    }

    if (!write_output(a.out_path, out)) {
      std::cerr << "IO error: failed to write output: " << a.out_path << "\n";
      return kExitIoError;
    }
    return kExitOk;

  } catch (const CliFailure& f) {
    std::cerr << f.message << "\n";
    return f.code;
  } catch (const Error& e) {
    log(LogLevel::ERROR, e.what());
    return exit_status(e.code());
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitComputation;
  }
}
