#include "gatenet/matrix.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "gatenet/core_utils.hpp"
#include "gatenet/errors.hpp"
#include "gatenet/rng.hpp"

using std::runtime_error;
using std::size_t;
using std::to_string;
using std::vector;

static std::string shape_string(size_t r, size_t c)
{
    return "(" + to_string(r) + "x" + to_string(c) + ")";
}

Matrix::Matrix()
    : rows(0), cols(0), data()
{
}

Matrix::Matrix(size_t r, size_t c, double value)
    : rows(0), cols(0), data()
{
    assign(r, c, value);
}

Matrix Matrix::zeros(size_t r, size_t c)
{
    if (r == 0 || c == 0) {
        throw runtime_error("Matrix::zeros: rows and cols must be > 0");
    }
    return Matrix(r, c, 0.0);
}

Matrix Matrix::random(size_t r, size_t c)
{
    if (r == 0 || c == 0) {
        throw runtime_error("Matrix::random: rows and cols must be > 0");
    }

    Matrix result(r, c);
    for (double& v : result.data) {
        v = random_uniform();
    }
    return result;
}

Matrix Matrix::column(const vector<double>& values)
{
    if (values.empty()) {
        throw runtime_error("Matrix::column: values must be non-empty");
    }

    Matrix result;
    result.rows = values.size();
    result.cols = 1;
    result.data = values;
    return result;
}

Matrix Matrix::from_data(size_t r, size_t c, vector<double> values)
{
    multiplication_overflow_check(r, c, "Matrix::from_data: size overflow");
    if (values.size() != r * c) {
        throw DimensionMismatchError("Matrix::from_data: data length " + to_string(values.size()) +
                                     " does not match shape " + shape_string(r, c));
    }

    Matrix result;
    result.rows = r;
    result.cols = c;
    result.data = std::move(values);
    return result;
}

void Matrix::assign(size_t r, size_t c, double value)
{
    multiplication_overflow_check(r, c, "Matrix::assign: size overflow");

    rows = r;
    cols = c;
    data.assign(r * c, value);
}

double& Matrix::operator()(size_t r, size_t c)
{
    if (r >= rows || c >= cols) {
        throw runtime_error("Matrix::operator(): index out of bounds");
    }

    return data[r * cols + c];
}

double Matrix::operator()(size_t r, size_t c) const
{
    if (r >= rows || c >= cols) {
        throw runtime_error("Matrix::operator() const: index out of bounds");
    }

    return data[r * cols + c];
}

bool Matrix::is_empty() const
{
    return rows == 0 || cols == 0;
}

bool Matrix::is_col_vector() const
{
    return cols == 1 && rows > 0;
}

void Matrix::require_non_empty(const char* error_msg) const
{
    if (is_empty()) throw DimensionMismatchError(error_msg);
}

void Matrix::require_shape(size_t r, size_t c, const char* error_msg) const
{
    if (rows != r || cols != c) {
        throw DimensionMismatchError(std::string(error_msg) + ": expected " + shape_string(r, c) +
                                     ", got " + shape_string(rows, cols));
    }
}

void Matrix::require_same_shape(const Matrix& other, const char* error_msg) const
{
    other.require_shape(rows, cols, error_msg);
}

Matrix Matrix::add(const Matrix& other) const
{
    require_same_shape(other, "Matrix::add: shape mismatch");

    Matrix result(*this);
    for (size_t i = 0; i < data.size(); ++i) {
        result.data[i] += other.data[i];
    }
    return result;
}

Matrix Matrix::subtract(const Matrix& other) const
{
    require_same_shape(other, "Matrix::subtract: shape mismatch");

    Matrix result(*this);
    for (size_t i = 0; i < data.size(); ++i) {
        result.data[i] -= other.data[i];
    }
    return result;
}

Matrix Matrix::hadamard(const Matrix& other) const
{
    require_same_shape(other, "Matrix::hadamard: shape mismatch");

    Matrix result(*this);
    for (size_t i = 0; i < data.size(); ++i) {
        result.data[i] *= other.data[i];
    }
    return result;
}

Matrix Matrix::transpose() const
{
    if (is_empty()) return Matrix();

    Matrix result(cols, rows);

    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[j * rows + i] = data[i * cols + j];
        }
    }

    return result;
}

void Matrix::subtract_scaled_in_place(const Matrix& delta, double scale)
{
    require_same_shape(delta, "Matrix::subtract_scaled_in_place: shape mismatch");

    for (size_t i = 0; i < data.size(); ++i) {
        data[i] -= scale * delta.data[i];
    }
}

Matrix Matrix::dot(const Matrix& a, const Matrix& b)
{
    if (a.is_empty() || b.is_empty()) {
        throw DimensionMismatchError("Matrix::dot: matrices must not be empty");
    }

    if (a.get_cols() != b.get_rows()) {
        throw DimensionMismatchError("Matrix::dot: incompatible shapes " +
                                     shape_string(a.get_rows(), a.get_cols()) + " and " +
                                     shape_string(b.get_rows(), b.get_cols()));
    }

    Matrix result(a.get_rows(), b.get_cols(), 0.0);

    for (size_t i = 0; i < a.get_rows(); ++i) {
        for (size_t k = 0; k < a.get_cols(); ++k) {
            const double aik = a.data[i * a.cols + k];
            for (size_t j = 0; j < b.get_cols(); ++j) {
                result.data[i * result.cols + j] += aik * b.data[k * b.cols + j];
            }
        }
    }

    return result;
}

size_t Matrix::get_rows() const
{
    return rows;
}

size_t Matrix::get_cols() const
{
    return cols;
}

const vector<double>& Matrix::get_data() const
{
    return data;
}
