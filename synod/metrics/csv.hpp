#pragma once

#include <string>
#include <string_view>

namespace synod {

// Field quoted as RFC 4180 requires: in double quotes if it contains
// a comma, a quote or a line break, inner quotes doubled
std::string CsvField(std::string_view text);

}  // namespace synod
