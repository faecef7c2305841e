#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Built-in training problem with the hyperparameters known to solve it.
struct Example
{
    std::string name;
    std::string description;
    std::vector<std::vector<double>> inputs;
    std::vector<std::vector<double>> targets;
    std::vector<std::size_t> recommended_architecture;
    std::size_t recommended_epochs = 0;
    double recommended_learning_rate = 0.0;
};

std::vector<std::string> list_examples();
bool has_example(const std::string& name);
Example get_example(const std::string& name);
