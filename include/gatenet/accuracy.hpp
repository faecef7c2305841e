#pragma once

#include <cstddef>
#include <vector>

#include "gatenet/matrix.hpp"

class Network;

// A sample counts as correct when every output, thresholded at `threshold`,
// equals the corresponding target (also thresholded).
class AccuracyBinary
{
public:
    explicit AccuracyBinary(double threshold = 0.5);

    double calculate(const Matrix& output, const Matrix& target);
    double calculate_accumulated() const;

    void new_pass();

    double get_threshold() const;

private:
    double threshold;
    std::size_t accumulated_correct = 0;
    std::size_t accumulated_count = 0;
};

double dataset_accuracy(const Network& network,
                        const std::vector<std::vector<double>>& inputs,
                        const std::vector<std::vector<double>>& targets,
                        double threshold = 0.5);

double dataset_loss(const Network& network,
                    const std::vector<std::vector<double>>& inputs,
                    const std::vector<std::vector<double>>& targets);
