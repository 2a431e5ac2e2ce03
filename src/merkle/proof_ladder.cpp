#include "merkle/proof_ladder.hpp"
#include <stdexcept>
#include <string>

namespace merkle_stream {

void ProofLadder::add(size_t height, const Digest& hash) {
    if (steps_.size() <= height) {
        steps_.resize(height + 1);
    }
    steps_[height].push_back(hash);
}

std::vector<Bytes> ProofLadder::fold() const {
    std::vector<Bytes> proofs;
    for (size_t height = 0; height < steps_.size(); ++height) {
        const auto& step = steps_[height];
        if (step.size() > MAX_ENTRIES_PER_HEIGHT) {
            throw std::logic_error("More than 2 proofs of same height in proof set (height "
                                   + std::to_string(height) + ")");
        }
        proofs.insert(proofs.end(), step.begin(), step.end());
    }
    return proofs;
}

const std::vector<Digest>& ProofLadder::at(size_t height) const {
    static const std::vector<Digest> empty_step;
    if (height >= steps_.size()) {
        return empty_step;
    }
    return steps_[height];
}

size_t ProofLadder::size() const {
    size_t total = 0;
    for (const auto& step : steps_) {
        total += step.size();
    }
    return total;
}

} // namespace merkle_stream
