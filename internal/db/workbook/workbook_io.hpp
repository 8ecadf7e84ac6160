#pragma once

#include <filesystem>

#include "internal/db/api/result.hpp"
#include "internal/db/workbook/workbook.hpp"

namespace pipeline::db::workbook {

/*
  Container I/O for the durable file.

  The file is a sqlite database holding one TEXT-only table per workbook
  table. Backend errors are reported as portable db::Result codes; a
  file that is not a database comes back as NotADatabase.
*/

db::Result ReadWorkbook(const std::filesystem::path& path, Workbook& out);

// `path` must not exist yet. full_sync makes COMMIT durable before return.
db::Result WriteWorkbook(const std::filesystem::path& path, const Workbook& workbook, bool full_sync);

} // namespace pipeline::db::workbook
