#pragma once

#include <map>
#include <optional>
#include <string>

namespace report_export {

using Replacements = std::map<std::string, std::string>;

// Replaces every occurrence of each key by its value. Keys are applied in map order.
std::string substitute_placeholders(std::string text, const Replacements& replacements);

// Substitutes inside the text nodes of an XML document only; markup, element
// names and attributes are left as they are. Values are escaped on output.
// nullopt when the document does not parse.
std::optional<std::string> substitute_in_xml(const std::string& xml, const Replacements& replacements);

// Section entries of a packaged (zip) template that carry the placeholders.
bool is_section_entry(const std::string& entry_name);

// Renders a template into out_path. Zip packages (hwpx) are copied entry by
// entry with the section XML substituted; any other template is read as one
// XML document. False on any I/O or parse failure.
bool render_template(const std::string& template_path, const std::string& out_path,
    const Replacements& replacements);

} // namespace report_export
