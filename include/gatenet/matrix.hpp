#pragma once

#include <cstddef>
#include <vector>

class Matrix
{
public:
    Matrix();
    Matrix(std::size_t r, std::size_t c, double value = 0.0);

    static Matrix zeros(std::size_t r, std::size_t c);
    static Matrix random(std::size_t r, std::size_t c);
    static Matrix column(const std::vector<double>& values);
    static Matrix from_data(std::size_t r, std::size_t c, std::vector<double> values);

    void assign(std::size_t r, std::size_t c, double value = 0.0);

    double& operator()(std::size_t r, std::size_t c);
    double operator()(std::size_t r, std::size_t c) const;

    bool is_empty() const;
    bool is_col_vector() const;

    void require_non_empty(const char* error_msg) const;
    void require_shape(std::size_t r, std::size_t c, const char* error_msg) const;
    void require_same_shape(const Matrix& other, const char* error_msg) const;

    Matrix add(const Matrix& other) const;
    Matrix subtract(const Matrix& other) const;
    Matrix hadamard(const Matrix& other) const;
    Matrix transpose() const;

    template <class F>
    Matrix map(F f) const
    {
        Matrix result;
        result.rows = rows;
        result.cols = cols;
        result.data.reserve(data.size());
        for (double v : data) {
            result.data.push_back(f(v));
        }
        return result;
    }

    // this -= scale * delta, in place
    void subtract_scaled_in_place(const Matrix& delta, double scale);

    static Matrix dot(const Matrix& a, const Matrix& b);

    std::size_t get_rows() const;
    std::size_t get_cols() const;
    const std::vector<double>& get_data() const;

private:
    std::size_t rows;
    std::size_t cols;
    std::vector<double> data;
};
