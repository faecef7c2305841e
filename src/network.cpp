#include "gatenet/network.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "gatenet/core_utils.hpp"
#include "gatenet/errors.hpp"
#include "gatenet/losses.hpp"

using std::isfinite;
using std::runtime_error;
using std::size_t;
using std::string;
using std::to_string;
using std::vector;

Network::Network(const vector<size_t>& architecture, const Activation& activation, double learning_rate)
    : Network(architecture, activation, learning_rate, true)
{
}

Network::Network(const vector<size_t>& architecture, const Activation& activation,
                 double learning_rate, bool randomize)
    : architecture(architecture),
      weights(),
      biases(),
      activation(activation),
      learning_rate(learning_rate)
{
    validate_architecture(architecture, "Network");
    validate_learning_rate(learning_rate, "Network");

    if (!randomize) {
        return;
    }

    const size_t transitions = architecture.size() - 1;
    weights.reserve(transitions);
    biases.reserve(transitions);
    for (size_t i = 0; i < transitions; ++i) {
        weights.push_back(Matrix::random(architecture[i + 1], architecture[i]));
        biases.push_back(Matrix::random(architecture[i + 1], 1));
    }
}

Network Network::from_parameters(const vector<size_t>& architecture,
                                 vector<Matrix> weights,
                                 vector<Matrix> biases,
                                 const Activation& activation,
                                 double learning_rate)
{
    Network network(architecture, activation, learning_rate, false);

    const size_t transitions = architecture.size() - 1;
    if (weights.size() != transitions) {
        throw ArchitectureMismatchError("Network::from_parameters: expected " + to_string(transitions) +
                                        " weight matrices for architecture " + format_architecture(architecture) +
                                        ", got " + to_string(weights.size()));
    }
    if (biases.size() != transitions) {
        throw ArchitectureMismatchError("Network::from_parameters: expected " + to_string(transitions) +
                                        " bias vectors for architecture " + format_architecture(architecture) +
                                        ", got " + to_string(biases.size()));
    }

    for (size_t i = 0; i < transitions; ++i) {
        const Matrix& w = weights[i];
        if (w.get_rows() != architecture[i + 1] || w.get_cols() != architecture[i]) {
            throw ArchitectureMismatchError("Network::from_parameters: weight matrix " + to_string(i) +
                                            " has shape (" + to_string(w.get_rows()) + "x" + to_string(w.get_cols()) +
                                            "), expected (" + to_string(architecture[i + 1]) + "x" +
                                            to_string(architecture[i]) + ")");
        }

        const Matrix& b = biases[i];
        if (b.get_rows() != architecture[i + 1] || b.get_cols() != 1) {
            throw ArchitectureMismatchError("Network::from_parameters: bias vector " + to_string(i) +
                                            " has shape (" + to_string(b.get_rows()) + "x" + to_string(b.get_cols()) +
                                            "), expected (" + to_string(architecture[i + 1]) + "x1)");
        }
    }

    network.weights = std::move(weights);
    network.biases = std::move(biases);
    return network;
}

void Network::validate_architecture(const vector<size_t>& architecture, const char* context)
{
    if (architecture.size() < 2) {
        throw InvalidArchitectureError(string(context) + ": architecture needs at least 2 layers, got " +
                                       format_architecture(architecture));
    }

    for (size_t i = 0; i < architecture.size(); ++i) {
        if (architecture[i] == 0) {
            throw InvalidArchitectureError(string(context) + ": layer " + to_string(i) +
                                           " of architecture " + format_architecture(architecture) +
                                           " has zero neurons");
        }
    }
}

void Network::validate_learning_rate(double learning_rate, const char* context)
{
    if (!isfinite(learning_rate) || learning_rate <= 0.0) {
        throw runtime_error(string(context) + ": learning_rate must be positive and finite");
    }
}

void Network::forward_pass(const Matrix& input, vector<Matrix>& pre, vector<Matrix>& post) const
{
    input.require_shape(architecture.front(), 1, "Network: input shape mismatch");

    const size_t transitions = weights.size();
    pre.clear();
    post.clear();
    pre.reserve(transitions);
    post.reserve(transitions + 1);

    post.push_back(input);
    for (size_t l = 0; l < transitions; ++l) {
        pre.push_back(Matrix::dot(weights[l], post.back()).add(biases[l]));
        post.push_back(activation.apply(pre.back()));
    }
}

Matrix Network::feed_forward(const Matrix& input)
{
    vector<Matrix> pre;
    vector<Matrix> post;
    forward_pass(input, pre, post);

    pre_activations = std::move(pre);
    layer_outputs = std::move(post);
    return layer_outputs.back();
}

double Network::train_step(const Matrix& input, const Matrix& target)
{
    target.require_shape(architecture.back(), 1, "Network::train_step: target shape mismatch");

    const Matrix output = feed_forward(input);
    const double loss = LossMeanSquaredError::sample_loss(output, target);

    // all deltas come from the weights as they were at the start of the step
    const size_t transitions = weights.size();
    vector<Matrix> deltas(transitions);

    deltas[transitions - 1] = output.subtract(target)
                                    .hadamard(activation.derivative(pre_activations[transitions - 1]));

    for (size_t l = transitions - 1; l-- > 0;) {
        deltas[l] = Matrix::dot(weights[l + 1].transpose(), deltas[l + 1])
                        .hadamard(activation.derivative(pre_activations[l]));
    }

    for (size_t l = 0; l < transitions; ++l) {
        weights[l].subtract_scaled_in_place(Matrix::dot(deltas[l], layer_outputs[l].transpose()), learning_rate);
        biases[l].subtract_scaled_in_place(deltas[l], learning_rate);
    }

    return loss;
}

double Network::train(const vector<vector<double>>& inputs,
                      const vector<vector<double>>& targets,
                      size_t epochs)
{
    if (inputs.empty()) {
        throw runtime_error("Network::train: inputs must be non-empty");
    }
    if (inputs.size() != targets.size()) {
        throw DimensionMismatchError("Network::train: got " + to_string(inputs.size()) + " inputs but " +
                                     to_string(targets.size()) + " targets");
    }
    if (epochs == 0) {
        throw runtime_error("Network::train: epochs must be > 0");
    }

    for (size_t i = 0; i < inputs.size(); ++i) {
        if (inputs[i].size() != get_input_size()) {
            throw DimensionMismatchError("Network::train: input " + to_string(i) + " has " +
                                         to_string(inputs[i].size()) + " values, network expects " +
                                         to_string(get_input_size()));
        }
        if (targets[i].size() != get_output_size()) {
            throw DimensionMismatchError("Network::train: target " + to_string(i) + " has " +
                                         to_string(targets[i].size()) + " values, network produces " +
                                         to_string(get_output_size()));
        }
    }

    vector<Matrix> input_columns;
    vector<Matrix> target_columns;
    input_columns.reserve(inputs.size());
    target_columns.reserve(targets.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        input_columns.push_back(Matrix::column(inputs[i]));
        target_columns.push_back(Matrix::column(targets[i]));
    }

    LossMeanSquaredError loss;
    for (size_t epoch = 0; epoch < epochs; ++epoch) {
        loss.new_pass();
        for (size_t i = 0; i < input_columns.size(); ++i) {
            loss.add_sample_loss(train_step(input_columns[i], target_columns[i]));
        }
    }

    return loss.calculate_accumulated();
}

Matrix Network::evaluate(const Matrix& input) const
{
    vector<Matrix> pre;
    vector<Matrix> post;
    forward_pass(input, pre, post);
    return post.back();
}

vector<double> Network::evaluate(const vector<double>& input) const
{
    return evaluate(Matrix::column(input)).get_data();
}

const vector<size_t>& Network::get_architecture() const
{
    return architecture;
}

const vector<Matrix>& Network::get_weights() const
{
    return weights;
}

const vector<Matrix>& Network::get_biases() const
{
    return biases;
}

const Activation& Network::get_activation() const
{
    return activation;
}

double Network::get_learning_rate() const
{
    return learning_rate;
}

size_t Network::get_input_size() const
{
    return architecture.front();
}

size_t Network::get_output_size() const
{
    return architecture.back();
}

size_t Network::parameter_count() const
{
    size_t count = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        count += weights[i].get_data().size() + biases[i].get_data().size();
    }
    return count;
}

const vector<Matrix>& Network::get_pre_activations() const
{
    return pre_activations;
}

const vector<Matrix>& Network::get_layer_outputs() const
{
    return layer_outputs;
}
