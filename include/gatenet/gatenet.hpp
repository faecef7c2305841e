#pragma once

#include "gatenet/accuracy.hpp"
#include "gatenet/activations.hpp"
#include "gatenet/checkpoint.hpp"
#include "gatenet/cli.hpp"
#include "gatenet/core_utils.hpp"
#include "gatenet/data.hpp"
#include "gatenet/errors.hpp"
#include "gatenet/loss_plot.hpp"
#include "gatenet/losses.hpp"
#include "gatenet/matrix.hpp"
#include "gatenet/network.hpp"
#include "gatenet/rng.hpp"
#include "gatenet/training.hpp"
