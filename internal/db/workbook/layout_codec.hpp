#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/workbook/migrations.hpp"
#include "internal/db/workbook/workbook.hpp"
#include "internal/model/deal.hpp"
#include "internal/model/lookup_tables.hpp"
#include "internal/util/time.hpp"

namespace pipeline::db::workbook {

// Written into every layout that has a Metadata table.
struct MetadataStamp {
  util::TimePoint last_modified;
  std::string     generated_by;
};

/*
  Encoder for one on-disk layout version.

  All versions share the Deals and Lookups tables; they differ in the
  Metadata they write (1.0 writes none).
*/
class LayoutEncoder {
 public:
  virtual ~LayoutEncoder() = default;

  virtual std::string_view Version() const = 0;

  virtual Workbook Encode(const std::vector<model::Deal>& deals, const model::LookupTables& lookups, const MetadataStamp& stamp) const = 0;
};

// Throws UnsupportedVersionError for a version without an encoder.
const LayoutEncoder& EncoderFor(std::string_view version);

std::vector<std::string> KnownLayoutVersions();

// Fixed Deals header order written by every encoder.
const std::vector<std::string>& DealColumns();

// ---------------------------------------------------------------------
// Decoding (current layout)
// ---------------------------------------------------------------------

/*
  Reads the Deals table. Header matching ignores case, spaces and
  underscores and accepts common aliases (Account/Company, Value, ...).
  Unrecognized columns are kept on each deal as extra columns. Rows are
  returned as stored; normalization is the caller's job.
*/
std::vector<model::Deal> DecodeDeals(const Workbook& workbook);

// Lookup blocks layered over the defaults; nullopt without a Lookups table.
std::optional<model::LookupTables> DecodeLookups(const Workbook& workbook);

struct DecodedWorkbook {
  std::vector<model::Deal>           deals;
  std::optional<model::LookupTables> lookups;
  std::string                        source_version;
  std::vector<std::string>           migrations_applied;
};

/*
  Parser for any supported version: migrate the table model from the
  detected version to `target_version`, then run the current decoder.
*/
DecodedWorkbook DecodeWorkbook(Workbook workbook, const MigrationChain& chain, const std::string& target_version);

} // namespace pipeline::db::workbook
