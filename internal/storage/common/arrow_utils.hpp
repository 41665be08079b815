#pragma once

#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <string>

namespace epd::storage::common {

/*
  Whole-file overwrite (create-or-truncate). No temp file, no rename:
  a failure midway leaves a truncated file behind.
*/
inline arrow::Status OverwriteFile(const std::string& path, const uint8_t* data, int64_t size) {
  ARROW_ASSIGN_OR_RAISE(auto out, arrow::io::FileOutputStream::Open(path, /*append=*/false));
  ARROW_RETURN_NOT_OK(out->Write(data, size));
  return out->Close();
}

} // namespace epd::storage::common
