#pragma once

#include "ThreatRecord.hpp"

#include <istream>
#include <string>
#include <vector>

// Reads threats from CSV with a header row. The first column is the threat
// id. Columns named file_path/path, sha256/hash and description fill the
// typed fields; every other column becomes a text entry in additional_info.
// Empty cells are treated as absent.
//
// Throws RemediationResultException(INPUT_INVALID) for a missing header, a
// duplicated column name, a row with more cells than the header or a row
// without an id.
std::vector<ThreatRecord> ReadThreatCsv(std::istream& input);

std::vector<ThreatRecord> ReadThreatCsvFile(const std::string& path);
