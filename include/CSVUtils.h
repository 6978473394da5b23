#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and writing. Typing lives in LabeledDataset.

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record; quoted fields may span lines.
 * @param malformed set when the record ends inside an open quote.
 * @return empty vector at end of stream or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);

// Empty names become column_<n>; duplicates get a _2, _3... suffix.
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

// Quotes the field when it would not read back unchanged unquoted.
std::string escapeField(const std::string& value, char delimiter);
void writeRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter);
}
