#include "gatenet/activations.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "gatenet/errors.hpp"

using std::exp;
using std::string;
using std::tolower;
using std::transform;

static double sigmoid_value(double x)
{
    if (x >= 0) {
        return 1.0 / (1.0 + exp(-x));
    }

    const double x_exp = exp(x);
    return x_exp / (1.0 + x_exp);
}

Activation::Activation(ActivationKind kind)
    : kind(kind)
{
}

Activation Activation::sigmoid()
{
    return Activation(ActivationKind::Sigmoid);
}

Activation Activation::from_name(const string& name)
{
    string lowered = name;
    transform(lowered.begin(), lowered.end(), lowered.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });

    if (lowered == "sigmoid") {
        return Activation(ActivationKind::Sigmoid);
    }

    throw CorruptFormatError("Activation::from_name: unknown activation '" + name + "'. use sigmoid");
}

double Activation::apply(double x) const
{
    switch (kind) {
    case ActivationKind::Sigmoid:
        return sigmoid_value(x);
    }
    return sigmoid_value(x);
}

double Activation::derivative(double x) const
{
    switch (kind) {
    case ActivationKind::Sigmoid: {
        const double s = sigmoid_value(x);
        return s * (1.0 - s);
    }
    }
    const double s = sigmoid_value(x);
    return s * (1.0 - s);
}

Matrix Activation::apply(const Matrix& pre_activation) const
{
    return pre_activation.map([this](double x) { return apply(x); });
}

Matrix Activation::derivative(const Matrix& pre_activation) const
{
    return pre_activation.map([this](double x) { return derivative(x); });
}

ActivationKind Activation::get_kind() const
{
    return kind;
}

string Activation::get_name() const
{
    switch (kind) {
    case ActivationKind::Sigmoid:
        return "sigmoid";
    }
    return "sigmoid";
}

bool operator==(const Activation& a, const Activation& b)
{
    return a.get_kind() == b.get_kind();
}

bool operator!=(const Activation& a, const Activation& b)
{
    return !(a == b);
}
