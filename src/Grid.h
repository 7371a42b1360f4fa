#ifndef SALVO_GRID_H
#define SALVO_GRID_H

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

#include "battleship.h"

// Rectangular row-major container. Width is the length of a row, height the
// number of rows; both are fixed once constructed.
template <typename T>
class Grid {
public:
    typedef std::vector<T> Line;

    Grid(std::size_t width, std::size_t height)
        : width_(width), height_(height), data_(height, Line(width, T())) {}

    Grid(std::size_t width, std::size_t height, const T &fill)
        : width_(width), height_(height), data_(height, Line(width, fill)) {}

    explicit Grid(std::vector<Line> rows)
        : width_(rows.empty() ? 0 : rows.front().size()),
          height_(rows.size()),
          data_(std::move(rows)) {
        for (const auto &row : data_) {
            if (row.size() != width_)
                throw std::invalid_argument("Grid rows must all have the same length.");
        }
    }

    std::size_t width() const { return width_; }
    std::size_t height() const { return height_; }

    // Number of cells in one line along the axis
    std::size_t lengthOfAxis(Axis axis) const {
        return axis == Axis::Row ? width_ : height_;
    }

    // Number of lines along the axis
    std::size_t linesInAxis(Axis axis) const {
        return axis == Axis::Row ? height_ : width_;
    }

    T getValue(const Coordinate &coord) const {
        checkBounds(coord);
        return data_[coord.row][coord.column];
    }

    void setValue(const Coordinate &coord, const T &value) {
        checkBounds(coord);
        data_[coord.row][coord.column] = value;
    }

    Line getLine(Axis axis, std::size_t index) const {
        checkLineIndex(axis, index);
        if (axis == Axis::Row) return data_[index];

        Line column;
        column.reserve(height_);
        for (const auto &row : data_) column.push_back(row[index]);
        return column;
    }

    void setLine(Axis axis, std::size_t index, const Line &line) {
        checkLineIndex(axis, index);
        if (line.size() != lengthOfAxis(axis))
            throw std::invalid_argument("Line length does not match the grid.");

        if (axis == Axis::Row) {
            data_[index] = line;
        } else {
            for (std::size_t r = 0; r < height_; ++r) data_[r][index] = line[r];
        }
    }

    // Combines the stored line with `line` cell by cell: fn(stored, incoming)
    template <typename U, typename Fn>
    void mergeLine(Axis axis, std::size_t index, const std::vector<U> &line, Fn fn) {
        Line current = getLine(axis, index);
        if (line.size() != current.size())
            throw std::invalid_argument("Line length does not match the grid.");
        for (std::size_t i = 0; i < current.size(); ++i)
            current[i] = fn(current[i], line[i]);
        setLine(axis, index, current);
    }

    // The row and the column passing through coord
    std::pair<Line, Line> getLinesContext(const Coordinate &coord) const {
        checkBounds(coord);
        return std::make_pair(getLine(Axis::Row, coord.row),
                              getLine(Axis::Column, coord.column));
    }

    template <typename Fn>
    auto transform(Fn fn) const -> Grid<decltype(fn(std::declval<const T &>()))> {
        typedef decltype(fn(std::declval<const T &>())) U;
        std::vector<std::vector<U>> rows;
        rows.reserve(height_);
        for (const auto &row : data_) {
            std::vector<U> out;
            out.reserve(width_);
            for (const auto &value : row) out.push_back(fn(value));
            rows.push_back(std::move(out));
        }
        return makeShaped(std::move(rows));
    }

    template <typename U, typename Fn>
    auto merge(const Grid<U> &other, Fn fn) const
        -> Grid<decltype(fn(std::declval<const T &>(), std::declval<const U &>()))> {
        typedef decltype(fn(std::declval<const T &>(), std::declval<const U &>())) V;
        if (other.width() != width_ || other.height() != height_)
            throw std::invalid_argument("Cannot merge grids of different shapes.");

        std::vector<std::vector<V>> rows;
        rows.reserve(height_);
        for (std::size_t r = 0; r < height_; ++r) {
            std::vector<V> out;
            out.reserve(width_);
            for (std::size_t c = 0; c < width_; ++c)
                out.push_back(fn(data_[r][c], other.rows()[r][c]));
            rows.push_back(std::move(out));
        }
        return makeShaped(std::move(rows));
    }

    template <typename Pred>
    std::vector<Coordinate> findAll(Pred pred) const {
        std::vector<Coordinate> found;
        for (std::size_t r = 0; r < height_; ++r) {
            for (std::size_t c = 0; c < width_; ++c) {
                if (pred(data_[r][c])) {
                    Coordinate coord;
                    coord.row = r;
                    coord.column = c;
                    found.push_back(coord);
                }
            }
        }
        return found;
    }

    const std::vector<Line> &rows() const { return data_; }

private:
    // Keeps the width of grids that have no rows (height 0)
    template <typename U>
    Grid<U> makeShaped(std::vector<std::vector<U>> rows) const {
        if (rows.empty()) return Grid<U>(width_, 0);
        return Grid<U>(std::move(rows));
    }

    void checkBounds(const Coordinate &coord) const {
        if (coord.row >= height_) throw std::out_of_range("Row index out of bounds.");
        if (coord.column >= width_) throw std::out_of_range("Column index out of bounds.");
    }

    void checkLineIndex(Axis axis, std::size_t index) const {
        if (index >= linesInAxis(axis)) {
            throw std::out_of_range(axis == Axis::Row ? "Row index out of bounds."
                                                      : "Column index out of bounds.");
        }
    }

    std::size_t width_;
    std::size_t height_;
    std::vector<Line> data_;
};

#endif
