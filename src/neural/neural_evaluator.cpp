#include "vgc/neural/neural_evaluator.hpp"
#include "vgc/neural/state_encoder.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace vgc {

NeuralEvaluator::NeuralEvaluator(const std::string& model_path)
    : input_dim_(StateEncoder::INPUT_DIM)
{
    try {
        model_ = torch::jit::load(model_path);
        model_.eval();
    } catch (const c10::Error& e) {
        throw std::runtime_error("Failed to load model " + model_path + ": " + e.what());
    }
    std::cout << "Loaded value network from " << model_path << std::endl;
}

torch::Tensor NeuralEvaluator::make_input(const std::vector<std::vector<float>>& batch) const {
    const int batch_size = static_cast<int>(batch.size());

    // Pad or truncate each row to the model width
    std::vector<float> flat(static_cast<size_t>(batch_size) * input_dim_, 0.0f);
    for (int i = 0; i < batch_size; ++i) {
        size_t n = std::min(batch[i].size(), static_cast<size_t>(input_dim_));
        std::copy(batch[i].begin(), batch[i].begin() + n, flat.begin() + static_cast<size_t>(i) * input_dim_);
    }

    auto options = torch::TensorOptions().dtype(torch::kFloat32);
    return torch::from_blob(flat.data(), {batch_size, input_dim_}, options).clone();
}

float NeuralEvaluator::evaluate(const std::vector<float>& encoding) {
    return evaluate_batch({encoding}).front();
}

std::vector<float> NeuralEvaluator::evaluate_batch(const std::vector<std::vector<float>>& batch) {
    if (batch.empty()) {
        return {};
    }
    torch::Tensor input = make_input(batch);

    torch::Tensor output;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        torch::NoGradGuard no_grad;
        output = model_.forward({input}).toTensor().reshape({static_cast<long>(batch.size()), -1});
    }

    std::vector<float> results(batch.size());
    auto accessor = output.accessor<float, 2>();
    for (size_t i = 0; i < batch.size(); ++i) {
        results[i] = std::max(-1.0f, std::min(1.0f, accessor[i][0]));
    }
    return results;
}

LeafValueCallback NeuralEvaluator::callback(std::shared_ptr<NeuralEvaluator> net) {
    return [net](const std::vector<float>& encoding) {
        return net->evaluate(encoding);
    };
}

}  // namespace vgc
