#include "tests/test_common.hpp"

TEST_CASE("Sigmoid apply matches the logistic function")
{
    const Activation sigmoid = Activation::sigmoid();

    CHECK(sigmoid.apply(0.0) == doctest::Approx(0.5));
    CHECK(sigmoid.apply(2.0) == doctest::Approx(1.0 / (1.0 + exp(-2.0))));
    CHECK(sigmoid.apply(-2.0) == doctest::Approx(1.0 / (1.0 + exp(2.0))));
}

TEST_CASE("Sigmoid stays finite for large magnitude inputs")
{
    const Activation sigmoid = Activation::sigmoid();

    const double high = sigmoid.apply(1000.0);
    const double low = sigmoid.apply(-1000.0);
    CHECK(isfinite(high));
    CHECK(isfinite(low));
    CHECK(high == doctest::Approx(1.0));
    CHECK(low == doctest::Approx(0.0));
    CHECK(isfinite(sigmoid.derivative(-1000.0)));
}

TEST_CASE("Sigmoid derivative is s(x) * (1 - s(x)) of the pre-activation")
{
    const Activation sigmoid = Activation::sigmoid();

    CHECK(sigmoid.derivative(0.0) == doctest::Approx(0.25));

    const double x = 1.3;
    const double s = 1.0 / (1.0 + exp(-x));
    CHECK(sigmoid.derivative(x) == doctest::Approx(s * (1.0 - s)));

    const double h = 1e-6;
    const double numeric = (sigmoid.apply(x + h) - sigmoid.apply(x - h)) / (2.0 * h);
    CHECK(sigmoid.derivative(x) == doctest::Approx(numeric).epsilon(1e-6));
}

TEST_CASE("Activation applies element-wise to matrices")
{
    const Activation sigmoid = Activation::sigmoid();
    const Matrix z = Matrix::from_data(2, 1, {0.0, 0.0});

    const Matrix a = sigmoid.apply(z);
    CHECK(a.get_rows() == 2);
    CHECK(a(0, 0) == doctest::Approx(0.5));
    CHECK(a(1, 0) == doctest::Approx(0.5));

    const Matrix d = sigmoid.derivative(z);
    CHECK(d(0, 0) == doctest::Approx(0.25));
}

TEST_CASE("Activation names resolve back to the same variant")
{
    const Activation sigmoid = Activation::sigmoid();
    CHECK(sigmoid.get_name() == "sigmoid");
    CHECK(sigmoid.get_kind() == ActivationKind::Sigmoid);

    CHECK(Activation::from_name("sigmoid") == sigmoid);
    CHECK(Activation::from_name("Sigmoid") == sigmoid);
}

TEST_CASE("Activation::from_name rejects unknown names")
{
    CHECK_THROWS_WITH_AS(Activation::from_name("relu"),
                         "Activation::from_name: unknown activation 'relu'. use sigmoid",
                         CorruptFormatError);
}
