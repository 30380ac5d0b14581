/**
 * @file reference_extractor.hpp
 * @brief Syntax-only discovery of variable references inside payloads.
 */
#pragma once
#include "varplan/common/common.hpp"
#include "varplan/common/variable.hpp"

namespace varplan
{

/**
 * @brief Collect the distinct variable names referenced by a payload.
 *
 * @details
 * Every string value in the document is scanned, through arrays and objects
 * at any depth. Object keys, numbers, booleans and nulls are ignored. A
 * reference is either `$name` or `${name}`, where `name` is
 * `[A-Za-z_][A-Za-z0-9_]*`. The identifier after the sigil is taken
 * greedily, and scanning resumes after it.
 *
 * Tokens made only of digits (`$1`, `${42}`) are capture-group back-references
 * of the underlying query language and are discarded, as is any token that
 * starts with a digit.
 *
 * Extraction never fails; a payload without references yields an empty list.
 *
 * @param spec The payload to scan.
 * @return Distinct names, in first-seen order.
 */
std::vector<std::string> extract_references(const SpecJson& spec);

/**
 * @brief Scan a single string and append newly seen references.
 *
 * @param text The text to scan.
 * @param names Output list; names already present are not appended again.
 */
void scan_references(std::string_view text, std::vector<std::string>& names);

} // namespace varplan
