#include "gatenet/data.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

using std::find;
using std::runtime_error;
using std::string;
using std::vector;

static vector<vector<double>> two_input_truth_table()
{
    return {
        {0.0, 0.0},
        {0.0, 1.0},
        {1.0, 0.0},
        {1.0, 1.0},
    };
}

static Example make_gate(const string& name, const string& description,
                         const vector<double>& outputs, vector<std::size_t> architecture,
                         std::size_t epochs)
{
    Example ex;
    ex.name = name;
    ex.description = description;
    ex.inputs = two_input_truth_table();
    for (double v : outputs) {
        ex.targets.push_back({v});
    }
    ex.recommended_architecture = std::move(architecture);
    ex.recommended_epochs = epochs;
    ex.recommended_learning_rate = 0.5;
    return ex;
}

vector<string> list_examples()
{
    return {"and", "or", "xor"};
}

bool has_example(const string& name)
{
    const vector<string> names = list_examples();
    return find(names.begin(), names.end(), name) != names.end();
}

Example get_example(const string& name)
{
    if (name == "and") {
        return make_gate("and",
                         "Logical AND gate - outputs 1 only when both inputs are 1. Linearly separable.",
                         {0.0, 0.0, 0.0, 1.0}, {2, 2, 1}, 5000);
    }
    if (name == "or") {
        return make_gate("or",
                         "Logical OR gate - outputs 1 when at least one input is 1. Linearly separable.",
                         {0.0, 1.0, 1.0, 1.0}, {2, 2, 1}, 5000);
    }
    if (name == "xor") {
        return make_gate("xor",
                         "Logical XOR gate - outputs 1 when the inputs differ. Not linearly separable, needs a hidden layer.",
                         {0.0, 1.0, 1.0, 0.0}, {2, 3, 1}, 10000);
    }

    throw runtime_error("get_example: unknown example '" + name + "'. use and, or or xor");
}
