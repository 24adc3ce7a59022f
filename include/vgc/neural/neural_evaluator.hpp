#pragma once

/**
 * TorchScript value network for search leaves.
 *
 * Only built with VGC_USE_LIBTORCH. The model takes a
 * [batch, StateEncoder::INPUT_DIM] float tensor and returns one value
 * per row in [-1, 1] from the encoded perspective.
 */

#include "vgc/search/evaluator.hpp"
#include <torch/script.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vgc {

/**
 * Usage:
 *   auto net = std::make_shared<NeuralEvaluator>("models/value_net.torchscript");
 *   config.evaluator.leaf_value = NeuralEvaluator::callback(net);
 *   config.evaluator.neural_weight = 0.5f;
 */
class NeuralEvaluator {
public:
    /**
     * @throws std::runtime_error if the model cannot be loaded
     */
    explicit NeuralEvaluator(const std::string& model_path);

    float evaluate(const std::vector<float>& encoding);

    std::vector<float> evaluate_batch(const std::vector<std::vector<float>>& batch);

    int input_dim() const { return input_dim_; }

    // Leaf callback sharing ownership of the network
    static LeafValueCallback callback(std::shared_ptr<NeuralEvaluator> net);

private:
    torch::Tensor make_input(const std::vector<std::vector<float>>& batch) const;

    torch::jit::script::Module model_;
    std::mutex mutex_;      // Search workers share one module
    int input_dim_;
};

}  // namespace vgc
