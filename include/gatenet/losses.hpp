#pragma once

#include <cstddef>

#include "gatenet/matrix.hpp"

class LossMeanSquaredError
{
public:
    // mean of squared (target - output) over the output elements
    static double sample_loss(const Matrix& output, const Matrix& target);

    double calculate(const Matrix& output, const Matrix& target);
    double add_sample_loss(double loss);

    double calculate_accumulated() const;
    std::size_t get_accumulated_count() const;

    void new_pass();

private:
    double accumulated_sum = 0.0;
    std::size_t accumulated_count = 0;
};
