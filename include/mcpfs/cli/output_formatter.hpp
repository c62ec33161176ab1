#pragma once

#include <mcpfs/core/result.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace mcpfs {

// ---------------------------------------------------------------------------
// OutputFormatter: stdout/stderr rendering for `mcpfs tools` and `mcpfs call`.
//
// Results go to `out`, errors to `err`. JSON mode emits one JSON document per
// call and wins over color mode; color mode renders tables with FTXUI.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Rows shorter than `headers` are padded. JSON mode: array of objects
    // keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    void PrintJson(const std::string& json) const;

    // Tool output verbatim; {"text": ...} in JSON mode.
    void PrintText(const std::string& text) const;

    // Error::ToJson() in JSON mode.
    void PrintError(const Error& error) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace mcpfs
