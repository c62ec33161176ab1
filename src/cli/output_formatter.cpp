#include <mcpfs/cli/output_formatter.hpp>
#include <mcpfs/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace mcpfs {

namespace {

using namespace mcpfs::ansi;

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size(); ++c) {
                obj[headers[c]] = c < row.size() ? row[c] : std::string();
            }
            array.push_back(std::move(obj));
        }
        out_ << Dump(array) << "\n";
        return;
    }

    std::vector<std::vector<std::string>> table;
    table.reserve(rows.size() + 1);
    table.push_back(headers);
    for (const auto& row : rows) {
        auto padded = row;
        padded.resize(headers.size());
        table.push_back(std::move(padded));
    }

    if (color_mode_) {
        auto ftx = ftxui::Table(table);
        ftx.SelectRow(0).Decorate(ftxui::bold);
        ftx.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        ftx.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = ftx.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (const auto& line : table) {
        for (size_t c = 0; c < line.size(); ++c) {
            widths[c] = std::max(widths[c], line[c].size());
        }
    }

    auto print_line = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < cells.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << cells[c];
        }
        out_ << "\n";
    };

    print_line(table.front());
    std::vector<std::string> rule;
    for (auto w : widths) rule.emplace_back(w, '-');
    print_line(rule);
    for (size_t r = 1; r < table.size(); ++r) {
        print_line(table[r]);
    }
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintText(const std::string& text) const {
    if (json_mode_) {
        out_ << Dump({{"text", text}}) << "\n";
        return;
    }
    out_ << text;
    if (text.empty() || text.back() != '\n') out_ << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    // Error: OPERATION [TARGET] (category)
    //   message
    //   Hint: ...
    const char* red = color_mode_ ? kRed : "";
    const char* bold = color_mode_ ? kBold : "";
    const char* dim = color_mode_ ? kDim : "";
    const char* yellow = color_mode_ ? kYellow : "";
    const char* reset = color_mode_ ? kReset : "";

    err_ << red << "Error: " << reset << bold << error.operation << reset;
    if (!error.target.empty()) {
        err_ << " " << error.target;
    }
    err_ << dim << " (" << error.CategoryName() << ")" << reset << "\n";
    err_ << "  " << error.message << "\n";
    if (error.hint.has_value() && !error.hint->empty()) {
        err_ << "  " << yellow << "Hint: " << reset << *error.hint << "\n";
    }
}

} // namespace mcpfs
