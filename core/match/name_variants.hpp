#pragma once

#include <string>
#include <vector>

namespace warmpath {

/// Normalized spellings of a person name:
/// as given, first + last, last-first, first initial + last,
/// first + last initial. "John A. Smith" yields
/// {"john a smith", "john smith", "smith john", "j smith", "john s"}.
std::vector<std::string> nameVariants(const std::string& name);

/// Normalized spellings of a company name with corporate suffixes
/// stripped and added: "Acme Corp" yields "acme corp", "acme",
/// "acme inc", "acme llc", ... Empty input yields nothing.
std::vector<std::string> companyVariants(const std::string& company);

} // namespace warmpath
