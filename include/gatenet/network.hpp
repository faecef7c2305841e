#pragma once

#include <cstddef>
#include <vector>

#include "gatenet/activations.hpp"
#include "gatenet/matrix.hpp"

// Fully connected feed-forward network trained by per-sample gradient descent
// on the squared error.
//
// Layer l (0-based transition index) maps a column vector of
// architecture[l] values to architecture[l + 1] values:
//   z_l = W_l * a_l + b_l,  a_{l+1} = f(z_l)
//
// feed_forward and train_step keep the z and a values of the last pass for
// backpropagation, so a Network must not be shared by concurrent trainers.
// evaluate is const and keeps nothing.
class Network
{
public:
    Network(const std::vector<std::size_t>& architecture, const Activation& activation, double learning_rate);

    static Network from_parameters(const std::vector<std::size_t>& architecture,
                                   std::vector<Matrix> weights,
                                   std::vector<Matrix> biases,
                                   const Activation& activation,
                                   double learning_rate);

    Matrix feed_forward(const Matrix& input);
    double train_step(const Matrix& input, const Matrix& target);

    // returns the mean sample loss of the last epoch
    double train(const std::vector<std::vector<double>>& inputs,
                 const std::vector<std::vector<double>>& targets,
                 std::size_t epochs);

    Matrix evaluate(const Matrix& input) const;
    std::vector<double> evaluate(const std::vector<double>& input) const;

    const std::vector<std::size_t>& get_architecture() const;
    const std::vector<Matrix>& get_weights() const;
    const std::vector<Matrix>& get_biases() const;
    const Activation& get_activation() const;
    double get_learning_rate() const;

    std::size_t get_input_size() const;
    std::size_t get_output_size() const;
    std::size_t parameter_count() const;

    // state retained by the last feed_forward; empty before the first pass
    const std::vector<Matrix>& get_pre_activations() const;
    const std::vector<Matrix>& get_layer_outputs() const;

private:
    Network(const std::vector<std::size_t>& architecture, const Activation& activation,
            double learning_rate, bool randomize);

    static void validate_architecture(const std::vector<std::size_t>& architecture, const char* context);
    static void validate_learning_rate(double learning_rate, const char* context);

    void forward_pass(const Matrix& input, std::vector<Matrix>& pre, std::vector<Matrix>& post) const;

    std::vector<std::size_t> architecture;
    std::vector<Matrix> weights;
    std::vector<Matrix> biases;
    Activation activation;
    double learning_rate;

    std::vector<Matrix> pre_activations;
    std::vector<Matrix> layer_outputs;
};
