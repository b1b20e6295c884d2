#pragma once

#include <shared/types/Common.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace ImageOptimizer::Domain {

struct QualityDecision {
    int quality = 0;
    Types::CompressionStrategy strategy = Types::CompressionStrategy::BALANCED;
    Types::ContentType contentType = Types::ContentType::MIXED;
    std::vector<std::string> reasoning;  // rule labels in firing order

    bool hasReason(const std::string& label) const {
        return std::find(reasoning.begin(), reasoning.end(), label) != reasoning.end();
    }

    std::string describe() const {
        std::string text = "Quality " + std::to_string(quality) + "%: ";
        for (size_t i = 0; i < reasoning.size(); ++i) {
            if (i > 0) text += ", ";
            text += reasoning[i];
        }
        return text;
    }
};

}  // namespace ImageOptimizer::Domain
