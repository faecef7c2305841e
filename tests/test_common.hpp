#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <doctest/doctest.h>

#include "gatenet/gatenet.hpp"

using std::cout;
using std::exp;
using std::ifstream;
using std::isfinite;
using std::numeric_limits;
using std::ofstream;
using std::ostringstream;
using std::runtime_error;
using std::size_t;
using std::streambuf;
using std::string;
using std::vector;

struct CoutSilencer {
    ostringstream buffer;
    streambuf* old = nullptr;

    CoutSilencer()
        : old(cout.rdbuf(buffer.rdbuf()))
    {
    }

    ~CoutSilencer()
    {
        cout.rdbuf(old);
    }
};

// Hands out paths in a per-test scratch directory and removes it afterwards.
struct TempDir {
    std::filesystem::path root;

    explicit TempDir(const string& name)
        : root(std::filesystem::temp_directory_path() / ("gatenet_test_" + name))
    {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    string path(const string& file) const
    {
        return (root / file).string();
    }
};

inline void reset_deterministic_rng(uint32_t seed)
{
    set_global_seed(seed);
}

inline Network make_zero_network(const vector<size_t>& architecture, double learning_rate = 0.5)
{
    vector<Matrix> weights;
    vector<Matrix> biases;
    for (size_t i = 0; i + 1 < architecture.size(); ++i) {
        weights.push_back(Matrix::zeros(architecture[i + 1], architecture[i]));
        biases.push_back(Matrix::zeros(architecture[i + 1], 1));
    }
    return Network::from_parameters(architecture, weights, biases, Activation::sigmoid(), learning_rate);
}

inline bool same_parameters(const Network& a, const Network& b)
{
    if (a.get_architecture() != b.get_architecture()) return false;

    for (size_t i = 0; i < a.get_weights().size(); ++i) {
        if (a.get_weights()[i].get_data() != b.get_weights()[i].get_data()) return false;
        if (a.get_biases()[i].get_data() != b.get_biases()[i].get_data()) return false;
    }
    return true;
}

inline void write_text_file(const string& path, const string& contents)
{
    ofstream out(path);
    out << contents;
}

inline string read_text_file(const string& path)
{
    ifstream in(path);
    ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}
