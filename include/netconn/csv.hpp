#pragma once

#include <cstddef>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace netconn {

// CSV writer for per-vertex result tables (vertex,parent,root / vertex,label).
// Cells containing separators, quotes or line breaks are quoted.
class CSVWriter {
public:
    explicit CSVWriter(const std::string& filePath);
    ~CSVWriter();

    bool is_open() const { return static_cast<bool>(ofs_); }
    void close();

    // Number of data rows written so far (header excluded).
    std::size_t rows() const { return rows_; }

    void header(const std::vector<std::string>& cols);
    void header(std::initializer_list<std::string> cols) { header(std::vector<std::string>(cols)); }

    void row(const std::vector<std::string>& cells);

    template <typename... Ts>
    void row(const Ts&... values) {
        std::vector<std::string> cells;
        cells.reserve(sizeof...(Ts));
        (cells.emplace_back(to_cell(values)), ...);
        row(cells);
    }

private:
    std::ofstream ofs_{};
    std::size_t rows_ = 0;

    void write_line(const std::vector<std::string>& cells);
    static std::string escape_cell(std::string_view s);

    template <typename T>
    static std::string to_cell(const T& v) {
        if constexpr (std::is_convertible_v<const T&, std::string_view>) {
            return std::string(std::string_view(v));
        } else {
            std::ostringstream oss;
            oss << v;
            return std::move(oss).str();
        }
    }
};

} // namespace netconn
