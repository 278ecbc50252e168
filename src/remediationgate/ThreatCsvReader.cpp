#include "ThreatCsvReader.hpp"

#include "RemediationResult.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

#include <fstream>
#include <set>

namespace {

enum class Column {
    Id,
    Path,
    Hash,
    Description,
    Extra,
};

[[noreturn]] void ThrowInputError(const std::string& message) {
    throw RemediationResultException(RemediationResultCode::INPUT_INVALID, message);
}

std::vector<std::string> SplitRow(const std::string& line, size_t lineNumber) {
    using Separator = boost::escaped_list_separator<char>;
    boost::tokenizer<Separator> tokens{line, Separator{'\\', ',', '"'}};

    std::vector<std::string> cells;
    try {
        for (const auto& token : tokens) {
            cells.push_back(boost::algorithm::trim_copy(token));
        }
    } catch (const boost::escaped_list_error& e) {
        ThrowInputError("line " + std::to_string(lineNumber) + ": " + e.what());
    }

    return cells;
}

Column Classify(const std::string& header, size_t index) {
    if (index == 0) {
        return Column::Id;
    }

    const auto name = boost::algorithm::to_lower_copy(header);
    if (name == "file_path" || name == "path") {
        return Column::Path;
    }
    if (name == "sha256" || name == "hash") {
        return Column::Hash;
    }
    if (name == "description") {
        return Column::Description;
    }

    return Column::Extra;
}

} // namespace

std::vector<ThreatRecord> ReadThreatCsv(std::istream& input) {
    std::string line;
    size_t lineNumber = 0;

    auto NextLine = [&input, &line, &lineNumber]() {
        while (std::getline(input, line)) {
            ++lineNumber;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!boost::algorithm::trim_copy(line).empty()) {
                return true;
            }
        }
        return false;
    };

    if (!NextLine()) {
        ThrowInputError("CSV input has no header row");
    }

    const auto headers = SplitRow(line, lineNumber);
    std::vector<Column> columns;
    std::set<Column> typedColumns;
    std::set<std::string> extraColumns;
    for (size_t i = 0; i < headers.size(); ++i) {
        if (headers[i].empty()) {
            ThrowInputError("CSV header column " + std::to_string(i + 1) + " has no name");
        }
        auto column = Classify(headers[i], i);
        const bool repeated = column == Column::Extra ? !extraColumns.insert(headers[i]).second
                                                      : !typedColumns.insert(column).second;
        if (repeated) {
            ThrowInputError("CSV header repeats column '" + headers[i] + "'");
        }
        columns.push_back(column);
    }

    std::vector<ThreatRecord> threats;
    while (NextLine()) {
        const auto cells = SplitRow(line, lineNumber);
        if (cells.size() > columns.size()) {
            ThrowInputError("line " + std::to_string(lineNumber) + " has " + std::to_string(cells.size())
                + " cells but the header names " + std::to_string(columns.size()));
        }

        ThreatRecord threat;
        for (size_t i = 0; i < cells.size(); ++i) {
            if (cells[i].empty()) {
                continue;
            }

            switch (columns[i]) {
            case Column::Id:
                threat.id = cells[i];
                break;
            case Column::Path:
                threat.path = cells[i];
                break;
            case Column::Hash:
                threat.hash = cells[i];
                break;
            case Column::Description:
                threat.description = cells[i];
                break;
            case Column::Extra:
                threat.extra.emplace_back(headers[i], cells[i]);
                break;
            }
        }

        if (threat.id.empty()) {
            ThrowInputError("line " + std::to_string(lineNumber) + " has no threat id");
        }

        threats.push_back(std::move(threat));
    }

    return threats;
}

std::vector<ThreatRecord> ReadThreatCsvFile(const std::string& path) {
    std::ifstream input{path};
    if (!input) {
        ThrowInputError("cannot open threat file " + path);
    }

    return ReadThreatCsv(input);
}
