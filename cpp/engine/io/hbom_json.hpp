#pragma once
/*
===============================================================================
IO: HBOM / Fragility / Climate Documents
File: cpp/engine/io/hbom_json.hpp
===============================================================================

Readers (JsonValue -> engine types):
  - flat HBOM records:        [ {...} ]  or  {"nodes": [ {...} ]}
  - fragility-curve docs:     [ {...} ]  or  {"curves": [ {...} ]}
  - prepared climate dataset: {"variables", "times", "data": [cells]}

Writers (engine types -> deterministic JSON):
  - HBOM tree:   {"sector", "components": [nodes]}
  - time series: {uuid: {variable: [pof...]}}
  - flat HBOM:   {"nodes": [...], "curves": [...]}

Conventions:
  - `null` is accepted for every numeric field and becomes NaN.
  - metadata / conditions values are kept as strings; non-string JSON
    values are stored as their compact JSON text.
  - Schema errors return false with a JsonParseError whose message names the
    offending path (e.g. "nodes[3].uuid"); offset/line/col stay at 0/1/1.
  - Every non-finite double is written as `null`.
===============================================================================
*/

#include <iosfwd>
#include <string>
#include <vector>

#include "engine/climate/climate_types.hpp"
#include "engine/fragility/fragility_computer.hpp"
#include "engine/hbom/hbom_types.hpp"
#include "engine/io/json_value.hpp"
#include "engine/io/json_writer.hpp"

namespace clirisk::io {

// ----------------------------- Readers ---------------------------------------
bool read_flat_records(const JsonValue& root,
                       std::vector<hbom::FlatHbomRecord>* out,
                       JsonParseError* err = nullptr);

bool read_curve_documents(const JsonValue& root,
                          std::vector<hbom::FragilityCurveDoc>* out,
                          JsonParseError* err = nullptr);

bool read_climate_dataset(const JsonValue& root,
                          climate::PreparedClimateDataset* out,
                          JsonParseError* err = nullptr);

// ----------------------------- Writers ---------------------------------------
// include_results=false drops pof, pof_by_var and fragility_curves
// (reconstruction output).
void write_tree_json(std::ostream& os,
                     const hbom::HbomTree& tree,
                     const JsonWriteOptions& opt = {},
                     bool include_results = true);

std::string tree_to_json(const hbom::HbomTree& tree,
                         const JsonWriteOptions& opt = {},
                         bool include_results = true);

void write_timeseries_json(std::ostream& os,
                           const fragility::PofTimeSeries& series,
                           const JsonWriteOptions& opt = {});

std::string timeseries_to_json(const fragility::PofTimeSeries& series,
                               const JsonWriteOptions& opt = {});

void write_flat_hbom_json(std::ostream& os,
                          const hbom::FlatHbom& flat,
                          const JsonWriteOptions& opt = {});

}  // namespace clirisk::io
