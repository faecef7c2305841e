#include "gatenet/losses.hpp"

#include <stdexcept>

#include "gatenet/errors.hpp"

using std::runtime_error;
using std::size_t;

double LossMeanSquaredError::sample_loss(const Matrix& output, const Matrix& target)
{
    output.require_non_empty("LossMeanSquaredError::sample_loss: output must be non-empty");
    output.require_same_shape(target, "LossMeanSquaredError::sample_loss: output and target must have the same shape");

    const auto& out = output.get_data();
    const auto& tgt = target.get_data();

    double sum = 0.0;
    for (size_t i = 0; i < out.size(); ++i) {
        const double diff = tgt[i] - out[i];
        sum += diff * diff;
    }

    return sum / static_cast<double>(out.size());
}

double LossMeanSquaredError::calculate(const Matrix& output, const Matrix& target)
{
    return add_sample_loss(sample_loss(output, target));
}

double LossMeanSquaredError::add_sample_loss(double loss)
{
    accumulated_sum += loss;
    ++accumulated_count;
    return loss;
}

double LossMeanSquaredError::calculate_accumulated() const
{
    if (accumulated_count == 0) {
        throw runtime_error("LossMeanSquaredError::calculate_accumulated: accumulated_count must be > 0");
    }
    return accumulated_sum / static_cast<double>(accumulated_count);
}

size_t LossMeanSquaredError::get_accumulated_count() const
{
    return accumulated_count;
}

void LossMeanSquaredError::new_pass()
{
    accumulated_sum = 0.0;
    accumulated_count = 0;
}
