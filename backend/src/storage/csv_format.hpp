#pragma once
#include <string>
#include <string_view>

#include "snapshot/snapshot_row.hpp"

// Cell rendering shared by every CSV writer.
//   null             -> ""
//   |double| > 1e10  -> truncated integer ("12345678901")
//   other doubles    -> shortest round-trip, integral values keep ".0"
//   integers         -> decimal
//   text             -> quoted only if it holds ',', '"', CR or LF
std::string format_value(const FieldValue& v);
std::string format_double(double v);
std::string csv_quote(std::string_view s);

// Header line (no trailing newline).
std::string csv_header();

// One formatted row (no trailing newline).
std::string format_row(const SnapshotRow& row);
