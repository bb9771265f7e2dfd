/// @file truth_table.cpp
/// @brief Truth table enumeration and formatting

#include "simulation/truth_table.hpp"

#include "simulation/sources.hpp"
#include "simulation/switch.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace wirelogic {

namespace {

std::vector<std::string> column_names(const std::vector<std::string>& given, std::size_t count,
                                      const std::string& prefix) {
    std::vector<std::string> names;
    names.reserve(count);
    for (std::size_t i = 0; i < count; i++) {
        names.push_back(i < given.size() ? given[i] : prefix + std::to_string(i));
    }
    return names;
}

// Cells are padded to their column header's width and separated by one space
void append_cell(std::string& line, const std::string& text, std::size_t width) {
    if (!line.empty()) {
        line += ' ';
    }
    line += text;
    line.append(width - std::min(width, text.size()), ' ');
}

void end_line(std::string& text, std::string line) {
    while (!line.empty() && line.back() == ' ') {
        line.pop_back();
    }
    text += line;
    text += '\n';
}

} // namespace

std::vector<TruthRow> tabulate(std::size_t input_count, const CircuitFactory& build) {
    if (input_count > MAX_TABULATED_INPUTS) {
        throw std::invalid_argument("tabulate() supports at most " + std::to_string(MAX_TABULATED_INPUTS) +
                                    " inputs");
    }

    auto ground = std::make_shared<Ground>();
    std::vector<std::shared_ptr<Switch>> switches;
    Inputs inputs;
    for (std::size_t j = 0; j < input_count; j++) {
        switches.push_back(std::make_shared<Switch>(ground));
        inputs.push_back(switches.back());
    }

    ElementPtr circuit = build(inputs);
    if (circuit == nullptr) {
        throw std::invalid_argument("tabulate() factory returned no element");
    }

    const std::size_t row_count = std::size_t{1} << input_count;
    std::vector<TruthRow> rows;
    rows.reserve(row_count);

    for (std::size_t k = 0; k < row_count; k++) {
        TruthRow row;
        for (std::size_t j = 0; j < input_count; j++) {
            bool level = ((k >> j) & 1) != 0;
            if (switches[j]->is_flipped() != level) {
                switches[j]->flip();
            }
            row.inputs.push_back(level);
        }
        row.outputs = circuit->evaluate_outputs();
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string format_truth_table(const std::vector<TruthRow>& rows, const std::vector<std::string>& input_names,
                               const std::vector<std::string>& output_names) {
    if (rows.empty()) {
        return {};
    }

    auto in_names = column_names(input_names, rows.front().inputs.size(), "in");
    auto out_names = column_names(output_names, rows.front().outputs.size(), "out");

    std::string text;
    std::string header;
    for (const auto& name : in_names) {
        append_cell(header, name, 1);
    }
    header += header.empty() ? "|" : " |";
    for (const auto& name : out_names) {
        append_cell(header, name, 1);
    }
    end_line(text, header);

    for (const auto& row : rows) {
        std::string line;
        for (std::size_t i = 0; i < row.inputs.size(); i++) {
            append_cell(line, row.inputs[i] ? "1" : "0", in_names[i].size());
        }
        line += line.empty() ? "|" : " |";
        for (std::size_t i = 0; i < row.outputs.size(); i++) {
            append_cell(line, row.outputs[i] ? "1" : "0", out_names[i].size());
        }
        end_line(text, line);
    }
    return text;
}

} // namespace wirelogic
