#include "netconn/csv.hpp"

namespace netconn {

CSVWriter::CSVWriter(const std::string& filePath) {
    ofs_.open(filePath, std::ios::out | std::ios::trunc);
}

CSVWriter::~CSVWriter() { if (ofs_) ofs_.flush(); }

void CSVWriter::close() { if (ofs_) { ofs_.flush(); ofs_.close(); } }

std::string CSVWriter::escape_cell(std::string_view s) {
    if (s.find_first_of(",\"\r\n") == std::string_view::npos) return std::string(s);
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void CSVWriter::write_line(const std::vector<std::string>& cells) {
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i) ofs_ << ',';
        ofs_ << escape_cell(cells[i]);
    }
    ofs_ << '\n';
}

void CSVWriter::header(const std::vector<std::string>& cols) {
    if (!ofs_) return;
    write_line(cols);
}

void CSVWriter::row(const std::vector<std::string>& cells) {
    if (!ofs_) return;
    write_line(cells);
    ++rows_;
}

} // namespace netconn
