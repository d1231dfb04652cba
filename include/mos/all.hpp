#pragma once
// core
#include "mos/core/variables.hpp"
#include "mos/core/errors.hpp"
#include "mos/core/log.hpp"
// ops
#include "mos/ops/activations.hpp"
#include "mos/ops/elementwise.hpp"
#include "mos/ops/graph.hpp"
#include "mos/ops/indexing.hpp"
#include "mos/ops/linalg.hpp"
#include "mos/ops/reduce.hpp"
#include "mos/ops/reshape.hpp"
#include "mos/ops/rng_extras.hpp"
#include "mos/ops/stats.hpp"
#include "mos/ops/tensor_utils.hpp"
// nn
#include "mos/nn/module.hpp"
#include "mos/nn/mode.hpp"
#include "mos/nn/model_config.hpp"
#include "mos/nn/layers/embedding.hpp"
#include "mos/nn/layers/linear.hpp"
#include "mos/nn/layers/locked_dropout.hpp"
#include "mos/nn/layers/lstm.hpp"
#include "mos/nn/layers/weight_drop.hpp"
#include "mos/nn/layers/recurrent_stack.hpp"
#include "mos/nn/layers/mixture_of_softmaxes.hpp"
#include "mos/nn/rnn_model.hpp"
