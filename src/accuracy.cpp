#include "gatenet/accuracy.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "gatenet/errors.hpp"
#include "gatenet/losses.hpp"
#include "gatenet/network.hpp"

using std::isfinite;
using std::runtime_error;
using std::size_t;
using std::to_string;
using std::vector;

AccuracyBinary::AccuracyBinary(double threshold)
    : threshold(threshold)
{
    if (!isfinite(threshold)) {
        throw runtime_error("AccuracyBinary: threshold must be finite");
    }
}

double AccuracyBinary::calculate(const Matrix& output, const Matrix& target)
{
    output.require_non_empty("AccuracyBinary::calculate: output must be non-empty");
    output.require_same_shape(target, "AccuracyBinary::calculate: output and target must have the same shape");

    const auto& out = output.get_data();
    const auto& tgt = target.get_data();

    bool correct = true;
    for (size_t i = 0; i < out.size(); ++i) {
        if ((out[i] > threshold) != (tgt[i] > threshold)) {
            correct = false;
            break;
        }
    }

    if (correct) {
        ++accumulated_correct;
    }
    ++accumulated_count;

    return correct ? 1.0 : 0.0;
}

double AccuracyBinary::calculate_accumulated() const
{
    if (accumulated_count == 0) {
        throw runtime_error("AccuracyBinary::calculate_accumulated: accumulated_count must be > 0");
    }
    return static_cast<double>(accumulated_correct) / static_cast<double>(accumulated_count);
}

void AccuracyBinary::new_pass()
{
    accumulated_correct = 0;
    accumulated_count = 0;
}

double AccuracyBinary::get_threshold() const
{
    return threshold;
}

static void require_paired_dataset(const vector<vector<double>>& inputs,
                                   const vector<vector<double>>& targets,
                                   const char* context)
{
    if (inputs.empty()) {
        throw runtime_error(std::string(context) + ": inputs must be non-empty");
    }
    if (inputs.size() != targets.size()) {
        throw DimensionMismatchError(std::string(context) + ": got " + to_string(inputs.size()) +
                                     " inputs but " + to_string(targets.size()) + " targets");
    }
}

double dataset_accuracy(const Network& network,
                        const vector<vector<double>>& inputs,
                        const vector<vector<double>>& targets,
                        double threshold)
{
    require_paired_dataset(inputs, targets, "dataset_accuracy");

    AccuracyBinary accuracy(threshold);
    for (size_t i = 0; i < inputs.size(); ++i) {
        accuracy.calculate(network.evaluate(Matrix::column(inputs[i])), Matrix::column(targets[i]));
    }
    return accuracy.calculate_accumulated();
}

double dataset_loss(const Network& network,
                    const vector<vector<double>>& inputs,
                    const vector<vector<double>>& targets)
{
    require_paired_dataset(inputs, targets, "dataset_loss");

    LossMeanSquaredError loss;
    for (size_t i = 0; i < inputs.size(); ++i) {
        loss.calculate(network.evaluate(Matrix::column(inputs[i])), Matrix::column(targets[i]));
    }
    return loss.calculate_accumulated();
}
