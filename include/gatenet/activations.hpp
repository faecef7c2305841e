#pragma once

#include <string>

#include "gatenet/matrix.hpp"

enum class ActivationKind { Sigmoid };

// Closed set of element-wise activation functions. Only the name is ever
// persisted; from_name resolves it back to the function pair.
class Activation
{
public:
    explicit Activation(ActivationKind kind = ActivationKind::Sigmoid);

    static Activation sigmoid();
    static Activation from_name(const std::string& name);

    double apply(double x) const;
    // derivative with respect to the pre-activation value x
    double derivative(double x) const;

    Matrix apply(const Matrix& pre_activation) const;
    Matrix derivative(const Matrix& pre_activation) const;

    ActivationKind get_kind() const;
    std::string get_name() const;

private:
    ActivationKind kind;
};

bool operator==(const Activation& a, const Activation& b);
bool operator!=(const Activation& a, const Activation& b);
