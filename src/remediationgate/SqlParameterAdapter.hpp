#pragma once

#include <string>
#include <unordered_map>
#include <vector>

// `@name` placeholders rewritten to positional `?` markers. A name may occur
// more than once; every occurrence binds the same logical value.
struct NormalizedSql {
    std::string sql;
    std::unordered_map<std::string, int> logicalIndexByName;
    std::vector<std::vector<unsigned int>> positionsByLogicalIndex;
    std::vector<int> logicalIndexByPosition;
};

// '@' inside single-quoted literals is copied through unchanged.
NormalizedSql NormalizeNamedParameters(const std::string& sql);
